#pragma once

#include <optional>
#include <string>

#include "configuration.hpp"

namespace sidecar {

    class ProbeResult {
    public:
        enum class Kind {
            Ready,
            NotReady,
            TransportError
        };

    private:
        Kind kind_;
        std::optional<int> statusCode_;
        std::string detail_;

        ProbeResult(Kind kind, std::optional<int> statusCode, std::string detail)
            : kind_(kind), statusCode_(statusCode), detail_(std::move(detail)) {}

    public:
        static ProbeResult ready(int statusCode) { return {Kind::Ready, statusCode, {}}; }
        // A server that answered with a non-2xx status, or (minimal variant) no server at all.
        static ProbeResult notReady(std::optional<int> statusCode = std::nullopt) { return {Kind::NotReady, statusCode, {}}; }
        static ProbeResult transportError(std::string detail) { return {Kind::TransportError, std::nullopt, std::move(detail)}; }

        Kind kind() const { return kind_; }
        bool isReady() const { return kind_ == Kind::Ready; }
        std::optional<int> statusCode() const { return statusCode_; }
        const std::string& detail() const { return detail_; }
    };

    inline const char* toString(ProbeResult::Kind kind) {
        switch (kind) {
            case ProbeResult::Kind::Ready: return "Ready";
            case ProbeResult::Kind::NotReady: return "NotReady";
            case ProbeResult::Kind::TransportError: return "TransportError";
        }
        return "Unknown";
    }

    // One synchronous readiness check. Stateless and never retries on its own.
    class HealthProbe {
    public:
        virtual ~HealthProbe() = default;
        virtual ProbeResult check() = 0;
    };

    // HTTP/1.1 GET over a plain TCP socket. Any 2xx is Ready.
    class HttpHealthProbe : public HealthProbe {
        BackendEndpoint endpoint;

    public:
        explicit HttpHealthProbe(BackendEndpoint endpoint);

        ProbeResult check() override;

        // Parses "HTTP/1.x NNN ..." and returns NNN, or nullopt if the line is not a status line.
        static std::optional<int> parseStatusLine(const std::string& line);
    };

}
