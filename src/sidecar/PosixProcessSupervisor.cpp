#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cpplocate/cpplocate.h>

#include <sidecar/sidecar.hpp>

extern char **environ;

namespace sidecar {

namespace {

constexpr auto kTerminateGracePeriod = std::chrono::seconds(2);
constexpr auto kReapPollInterval = std::chrono::milliseconds(20);

bool isExecutableFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return false;
    return ::access(path.c_str(), X_OK) == 0;
}

// The launcher's environment with `overrides` applied, as NAME=value strings.
std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view kv{*entry};
        auto eq = kv.find('=');
        auto name = std::string{kv.substr(0, eq)};
        if (!overrides.contains(name))
            env.emplace_back(kv);
    }
    for (auto& [name, value] : overrides)
        env.emplace_back(name + "=" + value);
    return env;
}

std::vector<char*> toPointerArray(std::vector<std::string>& storage) {
    std::vector<char*> ptrs;
    ptrs.reserve(storage.size() + 1);
    for (auto& s : storage)
        ptrs.push_back(s.data());
    ptrs.push_back(nullptr);
    return ptrs;
}

} // namespace

// SidecarLocator

SidecarLocator::SidecarLocator(std::filesystem::path searchDir)
    : searchDir(std::move(searchDir)) {
    if (this->searchDir.empty()) {
        auto exe = cpplocate::getExecutablePath();
        if (!exe.empty())
            this->searchDir = std::filesystem::path{exe}.parent_path();
    }
}

std::string SidecarLocator::targetTriple() {
#if defined(__APPLE__)
#if defined(__aarch64__) || defined(__arm64__)
    return "aarch64-apple-darwin";
#else
    return "x86_64-apple-darwin";
#endif
#elif defined(__linux__)
#if defined(__aarch64__)
    return "aarch64-unknown-linux-gnu";
#else
    return "x86_64-unknown-linux-gnu";
#endif
#else
    return "x86_64-unknown-unknown";
#endif
}

std::vector<std::filesystem::path> SidecarLocator::candidates(const std::string& sidecarName) const {
    if (searchDir.empty() || sidecarName.empty())
        return {};
    return {
        searchDir / sidecarName,
        searchDir / (sidecarName + "-" + targetTriple())
    };
}

std::optional<std::filesystem::path> SidecarLocator::locate(const std::string& sidecarName) const {
    for (auto& candidate : candidates(sidecarName))
        if (isExecutableFile(candidate))
            return candidate;
    return std::nullopt;
}

// PosixChildProcess

PosixChildProcess::PosixChildProcess(pid_t pid) : pid_(pid) {
}

PosixChildProcess::~PosixChildProcess() {
    terminate();
}

int PosixChildProcess::decodeWaitStatus(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

bool PosixChildProcess::running() {
    if (exitStatus)
        return false;
    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, WNOHANG);
    } while (rc == -1 && errno == EINTR);
    if (rc == 0)
        return true;
    if (rc == pid_)
        exitStatus = decodeWaitStatus(status);
    else
        exitStatus = -1; // ECHILD: somebody else reaped it
    return false;
}

int PosixChildProcess::waitForExit() {
    if (exitStatus)
        return *exitStatus;
    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, 0);
    } while (rc == -1 && errno == EINTR);
    exitStatus = rc == pid_ ? decodeWaitStatus(status) : -1;
    return *exitStatus;
}

void PosixChildProcess::terminate() {
    if (!running())
        return;

    Logger::global()->logInfo("Stopping backend (pid %lld)", static_cast<long long>(pid_));
    ::kill(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + kTerminateGracePeriod;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!running())
            return;
        std::this_thread::sleep_for(kReapPollInterval);
    }
    Logger::global()->logWarning("Backend (pid %lld) ignored SIGTERM, killing it", static_cast<long long>(pid_));
    ::kill(pid_, SIGKILL);
    waitForExit();
}

// PosixProcessSupervisor

PosixProcessSupervisor::PosixProcessSupervisor(SidecarLocator locator)
    : locator(std::move(locator)) {
}

std::optional<std::filesystem::path> PosixProcessSupervisor::locate(const std::string& sidecarName) {
    return locator.locate(sidecarName);
}

std::unique_ptr<ChildProcess> PosixProcessSupervisor::spawn(const SpawnRequest& request, std::string& errorMessage) {
    if (request.executable.empty()) {
        errorMessage = "no executable given";
        return nullptr;
    }

    std::vector<std::string> argvStorage;
    argvStorage.reserve(1 + request.arguments.size());
    argvStorage.push_back(request.executable.string());
    for (auto& arg : request.arguments)
        argvStorage.push_back(arg);
    auto argv = toPointerArray(argvStorage);

    auto envStorage = buildEnvironment(request.environment);
    auto envp = toPointerArray(envStorage);

    pid_t pid = -1;
    int rc = ::posix_spawn(&pid, request.executable.c_str(), nullptr, nullptr, argv.data(), envp.data());
    if (rc != 0) {
        errorMessage = "posix_spawn " + request.executable.string() + ": " + strerror(rc);
        return nullptr;
    }

    Logger::global()->logInfo("Spawned %s (pid %lld)", request.executable.c_str(), static_cast<long long>(pid));
    return std::make_unique<PosixChildProcess>(pid);
}

}
