#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace sidecar {

    struct SpawnRequest {
        std::filesystem::path executable;
        std::vector<std::string> arguments{};
        // Added to (and overriding) the launcher's own environment.
        std::map<std::string, std::string> environment{};
    };

    // Handle to the one spawned backend. Destroying it terminates and reaps the child,
    // so the backend never outlives the launcher.
    class ChildProcess {
    public:
        virtual ~ChildProcess() = default;

        virtual int64_t pid() const = 0;
        virtual bool running() = 0;
        // Blocks until the child exits. Returns its exit status, or 128 + signal number.
        virtual int waitForExit() = 0;
        virtual void terminate() = 0;
    };

    // Spawn capability. No restart or respawn semantics.
    class ProcessSupervisor {
    public:
        virtual ~ProcessSupervisor() = default;

        // Resolves the sidecar's executable. nullopt means there is nothing to spawn.
        virtual std::optional<std::filesystem::path> locate(const std::string& sidecarName) = 0;
        // nullptr on failure, with the reason in `errorMessage`.
        virtual std::unique_ptr<ChildProcess> spawn(const SpawnRequest& request, std::string& errorMessage) = 0;
    };

    // Sidecars ship next to the launcher executable, either as `<name>` or as
    // `<name>-<target triple>` (the layout a desktop bundler produces).
    class SidecarLocator {
        std::filesystem::path searchDir;

    public:
        // Defaults to the directory of the running executable.
        explicit SidecarLocator(std::filesystem::path searchDir = {});

        static std::string targetTriple();

        std::vector<std::filesystem::path> candidates(const std::string& sidecarName) const;
        std::optional<std::filesystem::path> locate(const std::string& sidecarName) const;
    };

    class PosixChildProcess : public ChildProcess {
        pid_t pid_;
        std::optional<int> exitStatus{};

        static int decodeWaitStatus(int status);

    public:
        explicit PosixChildProcess(pid_t pid);
        ~PosixChildProcess() override;

        PosixChildProcess(const PosixChildProcess&) = delete;
        PosixChildProcess& operator=(const PosixChildProcess&) = delete;

        int64_t pid() const override { return pid_; }
        bool running() override;
        int waitForExit() override;
        void terminate() override;
    };

    class PosixProcessSupervisor : public ProcessSupervisor {
        SidecarLocator locator;

    public:
        explicit PosixProcessSupervisor(SidecarLocator locator = SidecarLocator{});

        std::optional<std::filesystem::path> locate(const std::string& sidecarName) override;
        std::unique_ptr<ChildProcess> spawn(const SpawnRequest& request, std::string& errorMessage) override;
    };

}
