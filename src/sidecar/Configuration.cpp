#include <fstream>
#include <sstream>

#include <choc/text/choc_JSON.h>
#include <cpplocate/cpplocate.h>

#include <sidecar/sidecar.hpp>

namespace sidecar {

namespace {

constexpr const char* kApplicationName = "sidecar-launcher";
constexpr const char* kConfigurationFileName = "launcher.json";

int64_t requireInteger(const choc::value::ValueView& v, const char* key, int64_t min, int64_t max) {
    // choc parses anything with a fraction or exponent as float64
    if (!v.isInt())
        throw ConfigurationError(std::string{"'"} + key + "' must be an integer");
    int64_t n = v.isInt32() ? v.getInt32() : v.getInt64();
    if (n < min || n > max)
        throw ConfigurationError(std::string{"'"} + key + "' out of range: " + std::to_string(n)
            + " (expected " + std::to_string(min) + ".." + std::to_string(max) + ")");
    return n;
}

std::string requireString(const choc::value::ValueView& v, const char* key) {
    if (!v.isString())
        throw ConfigurationError(std::string{"'"} + key + "' must be a string");
    std::string s{v.getString()};
    if (s.empty())
        throw ConfigurationError(std::string{"'"} + key + "' must not be empty");
    return s;
}

bool requireBool(const choc::value::ValueView& v, const char* key) {
    if (!v.isBool())
        throw ConfigurationError(std::string{"'"} + key + "' must be true or false");
    return v.getBool();
}

} // namespace

std::string BackendEndpoint::baseUrl() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::string BackendEndpoint::probePath() const {
    return mode == ProbeMode::HealthEndpoint ? healthPath : "/";
}

std::string BackendEndpoint::probeUrl() const {
    return baseUrl() + probePath();
}

StatusBandTable::StatusBandTable(std::vector<StatusBand> bands, std::string fallback)
    : bands(std::move(bands)), fallback(std::move(fallback)) {
    for (size_t i = 1; i < this->bands.size(); ++i)
        if (this->bands[i].upperBound <= this->bands[i - 1].upperBound)
            throw ConfigurationError("status bands must be ordered by ascending threshold");
}

StatusBandTable StatusBandTable::defaults() {
    return StatusBandTable{
        {
            {10, "Starting server..."},
            {30, "Running database migrations..."}
        },
        "Almost ready..."
    };
}

const std::string& StatusBandTable::messageFor(uint32_t attempt) const {
    for (auto& band : bands)
        if (attempt < band.upperBound)
            return band.text;
    return fallback;
}

ReadinessPolicy ReadinessPolicy::standard() {
    return ReadinessPolicy{120, std::chrono::milliseconds{500}, StatusBandTable::defaults()};
}

ReadinessPolicy ReadinessPolicy::minimal() {
    return ReadinessPolicy{60, std::chrono::milliseconds{1000}, StatusBandTable::defaults()};
}

LaunchConfiguration LaunchConfiguration::standard() {
    return LaunchConfiguration{};
}

LaunchConfiguration LaunchConfiguration::minimal() {
    LaunchConfiguration config{};
    config.endpoint.mode = BackendEndpoint::ProbeMode::Root;
    config.endpoint.reportTransportErrors = false;
    config.readiness = ReadinessPolicy::minimal();
    config.splash.enabled = false;
    return config;
}

std::map<std::string, std::string> LaunchConfiguration::sidecarEnvironment() const {
    auto env = sidecar.environment;
    env["PORT"] = std::to_string(endpoint.port);
    return env;
}

LaunchConfiguration LaunchConfiguration::fromJson(const std::string& json, LaunchConfiguration base) {
    choc::value::Value parsed;
    try {
        parsed = choc::json::parse(json);
    } catch (const choc::json::ParseError& e) {
        throw ConfigurationError(std::string{"invalid JSON at line "} + std::to_string(e.lineAndColumn.line)
            + ", column " + std::to_string(e.lineAndColumn.column) + ": " + e.what());
    }
    auto j = parsed.getView();
    if (!j.isObject())
        throw ConfigurationError("configuration root must be an object");

    // the variant selects the preset that every other key refines
    auto config = std::move(base);
    if (j.hasObjectMember("variant")) {
        auto variant = requireString(j["variant"], "variant");
        if (variant == "standard")
            config = standard();
        else if (variant == "minimal")
            config = minimal();
        else
            throw ConfigurationError("unknown variant: " + variant);
    }

    if (j.hasObjectMember("host"))
        config.endpoint.host = requireString(j["host"], "host");
    if (j.hasObjectMember("port"))
        config.endpoint.port = static_cast<uint16_t>(requireInteger(j["port"], "port", 1, 65535));
    if (j.hasObjectMember("probeTimeoutMs"))
        config.endpoint.timeout = std::chrono::milliseconds{requireInteger(j["probeTimeoutMs"], "probeTimeoutMs", 1, 600000)};
    if (j.hasObjectMember("maxRetries"))
        config.readiness.maxRetries = static_cast<uint32_t>(requireInteger(j["maxRetries"], "maxRetries", 1, 100000));
    if (j.hasObjectMember("retryDelayMs"))
        config.readiness.retryDelay = std::chrono::milliseconds{requireInteger(j["retryDelayMs"], "retryDelayMs", 0, 600000)};
    if (j.hasObjectMember("sidecar"))
        config.sidecar.name = requireString(j["sidecar"], "sidecar");
    if (j.hasObjectMember("title")) {
        auto title = requireString(j["title"], "title");
        config.splash.title = title;
        config.mainView.title = title;
    }
    if (j.hasObjectMember("splash"))
        config.splash.enabled = requireBool(j["splash"], "splash");
    if (j.hasObjectMember("environment")) {
        auto env = j["environment"];
        if (!env.isObject())
            throw ConfigurationError("'environment' must be an object");
        env.visitObjectMembers([&config](std::string_view name, const choc::value::ValueView& value) {
            if (!value.isString())
                throw ConfigurationError("environment value for '" + std::string{name} + "' must be a string");
            config.sidecar.environment[std::string{name}] = std::string{value.getString()};
        });
    }
    return config;
}

LaunchConfiguration LaunchConfiguration::load(const std::filesystem::path& path) {
    if (path.empty() || !std::filesystem::exists(path))
        return standard();

    std::ifstream ifs{path.string()};
    if (!ifs)
        throw ConfigurationError("cannot read " + path.string());
    std::ostringstream ss;
    ss << ifs.rdbuf();

    try {
        return fromJson(ss.str());
    } catch (const ConfigurationError& e) {
        throw ConfigurationError(path.string() + ": " + e.what());
    }
}

std::filesystem::path LaunchConfiguration::defaultPath() {
    auto dir = cpplocate::localDir(kApplicationName);
    if (dir.empty())
        return {};
    return std::filesystem::path{dir} / kConfigurationFileName;
}

}
