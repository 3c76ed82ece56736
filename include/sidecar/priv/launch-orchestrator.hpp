#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "common.hpp"
#include "configuration.hpp"
#include "health-probe.hpp"
#include "presentation.hpp"
#include "process-supervisor.hpp"
#include "readiness-controller.hpp"

namespace sidecar {

    // Messages the readiness thread sends to the UI thread.
    struct StatusUpdate {
        std::string text;
    };

    struct OutcomeReached {
        LaunchOutcome outcome;
    };

    using LaunchMessage = std::variant<StatusUpdate, OutcomeReached>;

    // Splash -> spawn -> wait for readiness (background) -> main view or exit(1).
    //
    // start() and everything touching views run on the UI thread (see EventLoop).
    // The readiness thread never touches a view; it posts LaunchMessages instead.
    class LaunchOrchestrator {
    public:
        // Ends the process with the given status. Called from the readiness thread
        // on BackendFailed, or from the UI thread if the main view cannot be built.
        // Left empty, the logger is flushed and the process leaves via std::quick_exit.
        using Terminator = std::function<void(int exitCode)>;
        using Sleeper = ReadinessController::Sleeper;

        static constexpr const char* kSplashViewId = "splash";
        static constexpr const char* kMainViewId = "main";

    private:
        LaunchConfiguration config;
        PresentationLayer& presentation;
        ProcessSupervisor& supervisor;
        HealthProbe& probe;
        Terminator terminator;
        Sleeper sleeper;

        // UI thread only
        View* splashView_{nullptr};
        View* mainView_{nullptr};
        std::optional<LaunchOutcome> appliedOutcome_{};
        bool started{false};

        std::unique_ptr<ChildProcess> child;
        std::unique_ptr<ReadinessController> controller;
        std::thread worker;
        std::atomic<bool> readinessDone{false};

        ViewOptions splashOptions() const;
        ViewOptions mainViewOptions() const;

        void runReadiness();
        void post(LaunchMessage message);
        void apply(const LaunchMessage& message);
        void onBackendReady();
        void onBackendFailed();
        void abortStartup();

    public:
        LaunchOrchestrator(LaunchConfiguration config,
                           PresentationLayer& presentation,
                           ProcessSupervisor& supervisor,
                           HealthProbe& probe,
                           Terminator terminator,
                           Sleeper sleeper = {});
        // Waits for the readiness thread, then stops the backend.
        ~LaunchOrchestrator();

        LaunchOrchestrator(const LaunchOrchestrator&) = delete;
        LaunchOrchestrator& operator=(const LaunchOrchestrator&) = delete;

        // Creates the splash, spawns the backend and hands off to the readiness thread.
        // Anything but OK means nothing was probed and nothing is left running.
        LaunchStatus start();

        // Blocks until the readiness thread is done (outcome posted, termination requested).
        void waitForReadiness();
        bool readinessPending() const;
        // Stops the backend now instead of at destruction.
        void stopBackend();

        const LaunchConfiguration& configuration() const { return config; }
        View* splashView() const { return splashView_; }
        View* mainView() const { return mainView_; }
        std::optional<LaunchOutcome> appliedOutcome() const { return appliedOutcome_; }
        ChildProcess* backend() const { return child.get(); }
        // Valid after start() returned OK. Read attempt counters only after waitForReadiness().
        const ReadinessController* readiness() const { return controller.get(); }
    };

}
