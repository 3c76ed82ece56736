#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <vector>

#include <rtlog/rtlog.h>

#include <sidecar/sidecar.hpp>

namespace sidecar {

namespace {

constexpr std::size_t kQueueDepth = 128;
constexpr std::size_t kMaxRecordLength = 1024;
constexpr auto kDeliveryInterval = std::chrono::milliseconds(10);

std::atomic<std::size_t> recordSerial{0};

struct RecordContext {
    Logger::LogLevel level;
    Logger::Impl* target;
};

// The UI thread and the readiness thread both submit, hence the multi-writer queue.
using RecordQueue = rtlog::Logger<RecordContext, kQueueDepth, kMaxRecordLength, recordSerial, rtlog::MultiRealtimeWriterQueueType>;

const char* levelTag(Logger::LogLevel level) {
    switch (level) {
        case Logger::DIAGNOSTIC: return "diag";
        case Logger::INFO: return "info";
        case Logger::WARNING: return "warn";
        case Logger::ERROR: return "error";
    }
    return "?";
}

RecordQueue& recordQueue() {
    static RecordQueue queue;
    return queue;
}

} // namespace

class Logger::Impl {
    std::mutex sinkMutex;
    std::vector<Sink> sinks{};
    std::atomic<LogLevel> consoleLevel{INFO};

public:
    std::atomic<std::size_t> droppedRecords{0};

    void addSink(Sink sink) {
        std::lock_guard lock{sinkMutex};
        sinks.push_back(std::move(sink));
    }

    void setConsoleLevel(LogLevel level) { consoleLevel = level; }

    void submit(LogLevel level, const char* format, va_list args) {
        if (recordQueue().Logv(RecordContext{level, this}, format, args) != rtlog::Status::Success)
            ++droppedRecords;
    }

    // delivery thread only
    void deliver(LogLevel level, std::size_t serial, const char* message) {
        if (level >= consoleLevel.load())
            std::cerr << "[sidecar #" << serial << " (" << levelTag(level) << ")]: " << message << std::endl;
        std::lock_guard lock{sinkMutex};
        for (auto& sink : sinks)
            sink(level, serial, message);
    }
};

namespace {

struct DeliverRecord {
#if WIN32
    void operator()(const RecordContext& context, std::size_t serial, const char* format, ...)
#else
    void operator()(const RecordContext& context, std::size_t serial, const char* format, ...) __attribute__ ((format (printf, 4, 5)))
#endif
    {
        std::array<char, kMaxRecordLength> buffer;
        va_list args;
        va_start(args, format);
        vsnprintf(buffer.data(), buffer.size(), format, args);
        va_end(args);
        context.target->deliver(context.level, serial, buffer.data());
    }
};

DeliverRecord deliverRecord;
std::atomic<bool> deliveryStopped{false};

rtlog::LogProcessingThread<RecordQueue, DeliverRecord>& deliveryThread() {
    static rtlog::LogProcessingThread thread(recordQueue(), deliverRecord, kDeliveryInterval);
    return thread;
}

} // namespace

Logger::Logger() : impl(new Impl()) {
    deliveryThread();
}

void Logger::shutdown() {
    if (deliveryStopped.exchange(true))
        return;
    deliveryThread().Stop();
    if (auto dropped = global()->impl->droppedRecords.load())
        std::cerr << "[sidecar] " << dropped << " log records were dropped (queue full)" << std::endl;
}

void Logger::addSink(Sink sink) {
    impl->addSink(std::move(sink));
}

void Logger::setConsoleLevel(LogLevel level) {
    impl->setConsoleLevel(level);
}

#define SIDECAR_LOG_ENTRY(LEVEL, NAME) \
void Logger::NAME(const char* format, ...) { \
    va_list args; \
    va_start(args, format); \
    impl->submit(LEVEL, format, args); \
    va_end(args); \
}

SIDECAR_LOG_ENTRY(ERROR, logError)
SIDECAR_LOG_ENTRY(WARNING, logWarning)
SIDECAR_LOG_ENTRY(INFO, logInfo)
SIDECAR_LOG_ENTRY(DIAGNOSTIC, logDiagnostic)

#undef SIDECAR_LOG_ENTRY

static Logger instance{};

Logger::~Logger() {
    // queued records still point at the global instance
    if (this == &instance)
        shutdown();
    delete impl;
}

Logger* Logger::global() {
    return &instance;
}

}
