#pragma once

#include <atomic>
#include <functional>

#include <sidecar/sidecar.hpp>

namespace sidecar::test {

// Answers each check() with script(attempt), attempt counting from 1.
class ScriptedHealthProbe : public sidecar::HealthProbe {
    std::function<sidecar::ProbeResult(uint32_t attempt)> script;
    std::atomic<uint32_t> calls{0};

public:
    explicit ScriptedHealthProbe(std::function<sidecar::ProbeResult(uint32_t attempt)> script)
        : script(std::move(script)) {}

    sidecar::ProbeResult check() override {
        return script(++calls);
    }

    uint32_t invocations() const { return calls.load(); }

    static ScriptedHealthProbe readyOn(uint32_t readyAttempt, int notReadyStatus = 503) {
        return ScriptedHealthProbe{[readyAttempt, notReadyStatus](uint32_t attempt) {
            if (attempt >= readyAttempt)
                return sidecar::ProbeResult::ready(200);
            return sidecar::ProbeResult::notReady(notReadyStatus);
        }};
    }

    static ScriptedHealthProbe unreachable() {
        return ScriptedHealthProbe{[](uint32_t) {
            return sidecar::ProbeResult::transportError("connect: Connection refused");
        }};
    }
};

} // namespace sidecar::test
