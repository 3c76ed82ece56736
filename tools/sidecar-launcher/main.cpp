
#include <algorithm>
#include <atomic>
#include <cpptrace/from_current.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <sidecar/sidecar.hpp>
#include <sidecar-gui/ChocPresentationLayer.hpp>

int main(int argc, const char** argv) {
    CPPTRACE_TRY {
        std::vector<std::string> args;
        args.reserve(static_cast<size_t>(std::max(argc - 1, 0)));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        bool enableDebugger = false;
        std::optional<std::filesystem::path> configPath;
        for (const auto& arg : args) {
            if (arg == "--debug") {
                enableDebugger = true;
                continue;
            }
            if (arg == "--verbose") {
                sidecar::Logger::global()->setConsoleLevel(sidecar::Logger::DIAGNOSTIC);
                continue;
            }
            if (!configPath)
                configPath = arg;
        }

        sidecar::LaunchConfiguration config;
        try {
            config = sidecar::LaunchConfiguration::load(configPath.value_or(sidecar::LaunchConfiguration::defaultPath()));
        } catch (const sidecar::ConfigurationError& ex) {
            std::cerr << "sidecar-launcher: " << ex.what() << std::endl;
            return EXIT_FAILURE;
        }

        sidecar::EventLoop::initializeOnUIThread();

        sidecar::gui::ChocPresentationLayer presentation{{ .enableDebugger = enableDebugger }};
        sidecar::PosixProcessSupervisor supervisor{};
        sidecar::HttpHealthProbe probe{config.endpoint};

        std::atomic<int> exitCode{EXIT_SUCCESS};
        sidecar::LaunchOrchestrator orchestrator(config, presentation, supervisor, probe,
            [&exitCode](int code) {
                exitCode = code;
                sidecar::EventLoop::enqueueTaskOnMainThread([] { sidecar::EventLoop::stop(); });
            });

        auto status = orchestrator.start();
        if (status != sidecar::LaunchStatus::OK) {
            std::cerr << "sidecar-launcher: startup failed (" << sidecar::toString(status) << ")" << std::endl;
            return EXIT_FAILURE;
        }

        sidecar::EventLoop::start();

        if (orchestrator.readinessPending()) {
            // The last window was closed while still waiting. The readiness loop cannot be
            // cancelled, so take the backend down and leave without unwinding it.
            orchestrator.stopBackend();
            sidecar::Logger::shutdown();
            std::quick_exit(exitCode);
        }
        return exitCode;
    } CPPTRACE_CATCH(const std::exception& ex) {
        std::cerr << "Exception in sidecar-launcher: " << ex.what() << std::endl;
        cpptrace::from_current_exception().print();
        return EXIT_FAILURE;
    }
}
