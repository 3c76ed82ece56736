#pragma once

#include <cstdarg>
#include <cstdint>
#include <string>
#include <functional>
#if !WIN32
#include <pthread.h>
#endif

namespace sidecar {

    // Synchronous startup failures. Anything other than OK aborts the launch
    // before a single readiness probe is issued.
    enum class LaunchStatus {
        OK,
        VIEW_CREATION_FAILED,
        SPAWN_CAPABILITY_UNAVAILABLE,
        SPAWN_FAILED,
        ALREADY_STARTED
    };

    inline const char* toString(LaunchStatus status) {
        switch (status) {
            case LaunchStatus::OK: return "OK";
            case LaunchStatus::VIEW_CREATION_FAILED: return "VIEW_CREATION_FAILED";
            case LaunchStatus::SPAWN_CAPABILITY_UNAVAILABLE: return "SPAWN_CAPABILITY_UNAVAILABLE";
            case LaunchStatus::SPAWN_FAILED: return "SPAWN_FAILED";
            case LaunchStatus::ALREADY_STARTED: return "ALREADY_STARTED";
        }
        return "Unknown";
    }

    // Process-wide logger. Any thread may log; records are queued without locking and
    // handed to the sinks on a dedicated thread, in submission order.
    class Logger {
    public:
        class Impl;

#undef ERROR
        enum LogLevel {
            DIAGNOSTIC,
            INFO,
            WARNING,
            ERROR
        };

        using Sink = std::function<void(LogLevel level, size_t serial, const char* message)>;

        static Logger* global();
        // Drains pending records and stops the delivery thread. Logging afterwards is dropped.
        static void shutdown();

        Logger();
        ~Logger();

        void logError(const char* format, ...);
        void logWarning(const char* format, ...);
        void logInfo(const char* format, ...);
        void logDiagnostic(const char* format, ...);

        void addSink(Sink sink);
        // Records below this level are not printed to stderr. Defaults to INFO.
        void setConsoleLevel(LogLevel level);

    private:
        Impl *impl{nullptr};
    };

    inline void setCurrentThreadNameIfPossible(std::string const threadName) {
#if __APPLE__
        pthread_setname_np(threadName.c_str());
#elif defined(__unix__)
        pthread_setname_np(pthread_self(), threadName.c_str());
#endif
    }

}
