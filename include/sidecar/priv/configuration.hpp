#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace sidecar {

    class ConfigurationError : public std::runtime_error {
    public:
        explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
    };

    // Where the sidecar listens and how it is probed.
    struct BackendEndpoint {
        enum class ProbeMode {
            // GET /api/health, only answers 2xx once migrations are done
            HealthEndpoint,
            // GET /, the degraded check against the bare server
            Root
        };

        std::string host{"localhost"};
        uint16_t port{4000};
        std::string scheme{"http"};
        std::string healthPath{"/api/health"};
        ProbeMode mode{ProbeMode::HealthEndpoint};
        // When false, an unreachable server is reported as NotReady instead of TransportError.
        bool reportTransportErrors{true};
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};

        std::string baseUrl() const;
        std::string probePath() const;
        std::string probeUrl() const;
    };

    struct StatusBand {
        // applies while attempt < upperBound
        uint32_t upperBound;
        std::string text;
    };

    // Ordered threshold bands mapping an attempt number to user-facing progress text.
    class StatusBandTable {
        std::vector<StatusBand> bands;
        std::string fallback;

    public:
        StatusBandTable(std::vector<StatusBand> bands, std::string fallback);

        static StatusBandTable defaults();

        const std::string& messageFor(uint32_t attempt) const;
        const std::vector<StatusBand>& entries() const { return bands; }
        const std::string& fallbackText() const { return fallback; }
    };

    struct ReadinessPolicy {
        uint32_t maxRetries{120};
        std::chrono::milliseconds retryDelay{500};
        StatusBandTable statusBands{StatusBandTable::defaults()};

        static ReadinessPolicy standard();
        static ReadinessPolicy minimal();

        std::chrono::milliseconds worstCaseWait() const { return retryDelay * maxRetries; }
    };

    struct SidecarOptions {
        std::string name{"tsw_io_backend"};
        // PORT is always derived from the endpoint and overrides anything set here.
        std::map<std::string, std::string> environment{
            {"MIX_ENV", "prod"},
            {"BURRITO", "1"}
        };
    };

    struct SplashOptions {
        bool enabled{true};
        std::string title{"TSW IO"};
        int width{400};
        int height{300};
        std::string failureMessage{"Failed to start. Please restart the app."};
        std::string failureColor{"#ef4444"};
        std::chrono::milliseconds failureHold{std::chrono::seconds(3)};
    };

    struct MainViewOptions {
        std::string title{"TSW IO"};
        int width{1200};
        int height{800};
        int minWidth{800};
        int minHeight{600};
    };

    struct LaunchConfiguration {
        BackendEndpoint endpoint{};
        ReadinessPolicy readiness{};
        SidecarOptions sidecar{};
        SplashOptions splash{};
        MainViewOptions mainView{};

        // splash, /api/health, 120 x 500ms, transport errors reported
        static LaunchConfiguration standard();
        // no splash, bare root, 60 x 1000ms, transport errors folded into NotReady
        static LaunchConfiguration minimal();

        // Full child environment: configured entries plus PORT.
        std::map<std::string, std::string> sidecarEnvironment() const;

        // Applies a JSON override document on top of the given base. Throws ConfigurationError.
        static LaunchConfiguration fromJson(const std::string& json, LaunchConfiguration base = standard());
        // Missing file yields `standard()`. Throws ConfigurationError on unreadable or invalid files.
        static LaunchConfiguration load(const std::filesystem::path& path);
        static std::filesystem::path defaultPath();
    };

}
