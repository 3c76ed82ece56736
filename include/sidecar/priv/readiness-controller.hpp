#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "configuration.hpp"
#include "health-probe.hpp"

namespace sidecar {

    enum class LaunchOutcome {
        BackendReady,
        BackendFailed
    };

    inline const char* toString(LaunchOutcome outcome) {
        switch (outcome) {
            case LaunchOutcome::BackendReady: return "BackendReady";
            case LaunchOutcome::BackendFailed: return "BackendFailed";
        }
        return "Unknown";
    }

    // Bounded, fixed-interval polling of a HealthProbe.
    //
    // Probing(1) -> Probing(n) ... -> Ready | Exhausted
    //
    // Individual probe failures never end the loop early; only running out of
    // `maxRetries` attempts does. A controller runs exactly once.
    class ReadinessController {
    public:
        enum class State {
            Probing,
            Ready,
            Exhausted
        };

        // Receives the band text for each attempt that did not succeed. May throw; that is ignored.
        using StatusSink = std::function<void(const std::string& status)>;
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

    private:
        HealthProbe& probe;
        ReadinessPolicy policy;
        StatusSink statusSink;
        Sleeper sleeper;
        State state_{State::Probing};
        uint32_t attempt_{1};
        uint32_t probesIssued_{0};

        void publishStatus(const std::string& status);

    public:
        ReadinessController(HealthProbe& probe, ReadinessPolicy policy, StatusSink statusSink = {}, Sleeper sleeper = {});

        // Blocks the calling thread until Ready or Exhausted. Throws std::logic_error on a second call.
        LaunchOutcome run();

        State state() const { return state_; }
        // Current attempt while probing; the successful attempt once Ready; maxRetries once Exhausted.
        uint32_t attempt() const { return attempt_; }
        uint32_t probesIssued() const { return probesIssued_; }
        const ReadinessPolicy& readinessPolicy() const { return policy; }

        const std::string& statusMessageFor(uint32_t attempt) const { return policy.statusBands.messageFor(attempt); }
    };

}
