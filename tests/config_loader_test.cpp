#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "config/config_loader.hpp"
#include "utils/logging.hpp"

namespace {

using pysandbox::config::ApplyConfigFromJson;
using pysandbox::config::ApplyEnvOverrides;
using pysandbox::config::Config;
using pysandbox::config::LoadConfig;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"PYSANDBOX_CONFIG",
                                 "PYSANDBOX_RUNTIME__PRELOAD_PACKAGES",
                                 "PYSANDBOX_PRELOAD_PACKAGES",
                                 "PYSANDBOX_EXECUTOR__DEFAULT_TIMEOUT_S",
                                 "PYSANDBOX_DEFAULT_TIMEOUT_S",
                                 "PYSANDBOX_WORKDIR",
                                 "PYSANDBOX_LOG_LEVEL"}) {
            ::unsetenv(name);
        }
    }
};

TEST_F(ConfigLoaderTest, Defaults) {
    Config config{};
    EXPECT_EQ(config.executor.default_timeout_s, 30);
    ASSERT_EQ(config.runtime.preload_packages.size(), 3u);
    EXPECT_EQ(config.runtime.preload_packages[0], "numpy");
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigLoaderTest, AppliesJsonSections) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "runtime": {"preloadPackages": ["json", "math"], "pythonPath": ["/opt/lib"]},
        "executor": {"defaultTimeoutS": 45},
        "filesystem": {"workdir": "/srv/sandbox"},
        "logging": {"level": "debug"}
    })"));
    EXPECT_EQ(config.runtime.preload_packages, (std::vector<std::string>{"json", "math"}));
    EXPECT_EQ(config.runtime.python_path, (std::vector<std::string>{"/opt/lib"}));
    EXPECT_EQ(config.executor.default_timeout_s, 45);
    EXPECT_EQ(config.filesystem.workdir, "/srv/sandbox");
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigLoaderTest, NonPositiveDefaultTimeoutFallsBack) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"executor": {"defaultTimeoutS": -3}})"));
    EXPECT_EQ(config.executor.default_timeout_s, 30);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    ::setenv("PYSANDBOX_PRELOAD_PACKAGES", "json, re", 1);
    ::setenv("PYSANDBOX_EXECUTOR__DEFAULT_TIMEOUT_S", "7", 1);
    ::setenv("PYSANDBOX_DEFAULT_TIMEOUT_S", "99", 1);
    ::setenv("PYSANDBOX_LOG_LEVEL", "warn", 1);

    Config config{};
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.runtime.preload_packages, (std::vector<std::string>{"json", "re"}));
    EXPECT_EQ(config.executor.default_timeout_s, 7);
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigLoaderTest, EmptyPreloadListDisablesPreloading) {
    ::setenv("PYSANDBOX_RUNTIME__PRELOAD_PACKAGES", "", 1);
    Config config{};
    ApplyEnvOverrides(config);
    EXPECT_TRUE(config.runtime.preload_packages.empty());
}

TEST_F(ConfigLoaderTest, LoadsExplicitFileAndSurvivesGarbage) {
    const auto path = std::filesystem::temp_directory_path() / "pysandbox_config_test.json";
    {
        std::ofstream(path) << R"({"executor": {"defaultTimeoutS": 11}})";
    }
    ::setenv("PYSANDBOX_CONFIG", path.c_str(), 1);
    EXPECT_EQ(LoadConfig().executor.default_timeout_s, 11);

    {
        std::ofstream(path) << "{ this is not json";
    }
    EXPECT_EQ(LoadConfig().executor.default_timeout_s, 30);
    std::filesystem::remove(path);
}

TEST(LoggingTest, ParsesLevelNames) {
    using pysandbox::utils::LogLevel;
    using pysandbox::utils::ParseLogLevel;
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("chatty"), LogLevel::kInfo);
}

}  // namespace
