#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>

#include <sidecar/sidecar.hpp>

using namespace std::chrono_literals;
using sidecar::BackendEndpoint;
using sidecar::ConfigurationError;
using sidecar::LaunchConfiguration;
using sidecar::StatusBandTable;

namespace fs = std::filesystem;

TEST(StatusBandTableTest, DefaultThresholds) {
    auto table = StatusBandTable::defaults();
    EXPECT_EQ("Starting server...", table.messageFor(1));
    EXPECT_EQ("Starting server...", table.messageFor(9));
    EXPECT_EQ("Running database migrations...", table.messageFor(10));
    EXPECT_EQ("Running database migrations...", table.messageFor(29));
    EXPECT_EQ("Almost ready...", table.messageFor(30));
    EXPECT_EQ("Almost ready...", table.messageFor(120));
}

TEST(StatusBandTableTest, CustomTable) {
    StatusBandTable table{{{3, "a"}, {5, "b"}}, "c"};
    EXPECT_EQ("a", table.messageFor(2));
    EXPECT_EQ("b", table.messageFor(3));
    EXPECT_EQ("c", table.messageFor(5));
}

TEST(StatusBandTableTest, RejectsUnorderedBands) {
    EXPECT_THROW((StatusBandTable{{{30, "late"}, {10, "early"}}, "x"}), ConfigurationError);
}

TEST(LaunchConfigurationTest, StandardPreset) {
    auto config = LaunchConfiguration::standard();
    EXPECT_EQ("http://localhost:4000", config.endpoint.baseUrl());
    EXPECT_EQ("http://localhost:4000/api/health", config.endpoint.probeUrl());
    EXPECT_TRUE(config.endpoint.reportTransportErrors);
    EXPECT_EQ(120u, config.readiness.maxRetries);
    EXPECT_EQ(500ms, config.readiness.retryDelay);
    EXPECT_EQ(60s, config.readiness.worstCaseWait());
    EXPECT_TRUE(config.splash.enabled);
    EXPECT_EQ(400, config.splash.width);
    EXPECT_EQ(300, config.splash.height);
    EXPECT_EQ(1200, config.mainView.width);
    EXPECT_EQ(800, config.mainView.minWidth);
    EXPECT_EQ(3s, config.splash.failureHold);
}

TEST(LaunchConfigurationTest, MinimalPreset) {
    auto config = LaunchConfiguration::minimal();
    EXPECT_EQ(BackendEndpoint::ProbeMode::Root, config.endpoint.mode);
    EXPECT_EQ("http://localhost:4000/", config.endpoint.probeUrl());
    EXPECT_FALSE(config.endpoint.reportTransportErrors);
    EXPECT_EQ(60u, config.readiness.maxRetries);
    EXPECT_EQ(1000ms, config.readiness.retryDelay);
    EXPECT_FALSE(config.splash.enabled);
}

TEST(LaunchConfigurationTest, SidecarEnvironmentCarriesPortAndModeFlags) {
    auto config = LaunchConfiguration::standard();
    config.endpoint.port = 4123;
    config.sidecar.environment["PORT"] = "1";
    auto env = config.sidecarEnvironment();
    EXPECT_EQ("4123", env["PORT"]);
    EXPECT_EQ("prod", env["MIX_ENV"]);
    EXPECT_EQ("1", env["BURRITO"]);
    EXPECT_EQ(3u, env.size());
}

TEST(LaunchConfigurationTest, JsonOverrides) {
    auto config = LaunchConfiguration::fromJson(R"({
        "port": 4500,
        "host": "127.0.0.1",
        "maxRetries": 10,
        "retryDelayMs": 250,
        "probeTimeoutMs": 2000,
        "sidecar": "my_backend",
        "title": "My App",
        "environment": { "RELEASE_COOKIE": "abc" }
    })");
    EXPECT_EQ(4500, config.endpoint.port);
    EXPECT_EQ("127.0.0.1", config.endpoint.host);
    EXPECT_EQ(10u, config.readiness.maxRetries);
    EXPECT_EQ(250ms, config.readiness.retryDelay);
    EXPECT_EQ(2000ms, config.endpoint.timeout);
    EXPECT_EQ("my_backend", config.sidecar.name);
    EXPECT_EQ("My App", config.splash.title);
    EXPECT_EQ("My App", config.mainView.title);
    auto env = config.sidecarEnvironment();
    EXPECT_EQ("abc", env["RELEASE_COOKIE"]);
    EXPECT_EQ("prod", env["MIX_ENV"]);
    EXPECT_EQ("4500", env["PORT"]);
}

TEST(LaunchConfigurationTest, VariantSelectsPresetBeforeOverrides) {
    auto config = LaunchConfiguration::fromJson(R"({ "variant": "minimal", "maxRetries": 5, "splash": true })");
    EXPECT_EQ(BackendEndpoint::ProbeMode::Root, config.endpoint.mode);
    EXPECT_EQ(1000ms, config.readiness.retryDelay);
    EXPECT_EQ(5u, config.readiness.maxRetries);
    EXPECT_TRUE(config.splash.enabled);
}

TEST(LaunchConfigurationTest, InvalidDocumentsAreRejected) {
    EXPECT_THROW(LaunchConfiguration::fromJson("{ port: "), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson("[1, 2]"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "port": 0 })"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "port": 70000 })"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "port": "4000" })"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "port": 4000.5 })"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "maxRetries": 1e30 })"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "retryDelayMs": 250.0 })"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "maxRetries": 0 })"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "retryDelayMs": -1 })"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "variant": "turbo" })"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "splash": "yes" })"), ConfigurationError);
    EXPECT_THROW(LaunchConfiguration::fromJson(R"({ "environment": { "A": 1 } })"), ConfigurationError);
}

class LaunchConfigurationFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sidecar_config_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir))
            fs::remove_all(test_dir);
    }

    fs::path createTestFile(const std::string& filename, const std::string& content) {
        auto path = test_dir / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(LaunchConfigurationFileTest, MissingFileFallsBackToStandard) {
    auto config = LaunchConfiguration::load(test_dir / "nope.json");
    EXPECT_EQ(120u, config.readiness.maxRetries);
    EXPECT_EQ(4000, config.endpoint.port);
}

TEST_F(LaunchConfigurationFileTest, LoadsFile) {
    auto path = createTestFile("launcher.json", R"({ "port": 4001 })");
    auto config = LaunchConfiguration::load(path);
    EXPECT_EQ(4001, config.endpoint.port);
}

TEST_F(LaunchConfigurationFileTest, ErrorsNameTheFile) {
    auto path = createTestFile("broken.json", "{");
    try {
        LaunchConfiguration::load(path);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string{e.what()}.find("broken.json"), std::string::npos);
    }
}
