#include <stdexcept>
#include <thread>

#include <sidecar/sidecar.hpp>

namespace sidecar {

ReadinessController::ReadinessController(HealthProbe& probe, ReadinessPolicy policy, StatusSink statusSink, Sleeper sleeper)
    : probe(probe),
      policy(std::move(policy)),
      statusSink(std::move(statusSink)),
      sleeper(std::move(sleeper)) {
    if (this->policy.maxRetries == 0)
        throw std::invalid_argument("ReadinessController: maxRetries must be at least 1");
    if (!this->sleeper)
        this->sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

void ReadinessController::publishStatus(const std::string& status) {
    if (!statusSink)
        return;
    try {
        statusSink(status);
    } catch (const std::exception& e) {
        Logger::global()->logDiagnostic("Status update failed: %s", e.what());
    }
}

LaunchOutcome ReadinessController::run() {
    if (state_ != State::Probing || probesIssued_ != 0)
        throw std::logic_error("ReadinessController: run() can only be called once");

    auto logger = Logger::global();
    while (true) {
        ProbeResult result = ProbeResult::notReady();
        ++probesIssued_;
        try {
            result = probe.check();
        } catch (const std::exception& e) {
            result = ProbeResult::transportError(e.what());
        } catch (...) {
            result = ProbeResult::transportError("unknown error");
        }

        if (result.isReady()) {
            logger->logInfo("Backend ready after %u attempts", attempt_);
            state_ = State::Ready;
            return LaunchOutcome::BackendReady;
        }

        if (result.kind() == ProbeResult::Kind::TransportError)
            logger->logWarning("Health check error: %s", result.detail().c_str());
        else if (auto code = result.statusCode())
            logger->logDiagnostic("Health check answered HTTP %d", *code);

        publishStatus(policy.statusBands.messageFor(attempt_));

        logger->logInfo("Waiting for backend... attempt %u/%u", attempt_, policy.maxRetries);
        // the counter stops at maxRetries, and there is no wait after the final attempt
        if (attempt_ == policy.maxRetries)
            break;
        sleeper(policy.retryDelay);
        ++attempt_;
    }

    state_ = State::Exhausted;
    logger->logError("Backend failed to start after %u attempts", policy.maxRetries);
    return LaunchOutcome::BackendFailed;
}

}
