#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> ReadStringArray(const nlohmann::json& items) {
    std::vector<std::string> values;
    for (const auto& item : items) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

void NormalizeConfig(Config& config) {
    if (config.executor.default_timeout_s <= 0) {
        config.executor.default_timeout_s = kDefaultTimeoutSeconds;
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("PYSANDBOX_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".pysandbox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("runtime") && data["runtime"].is_object()) {
        const auto& runtime = data["runtime"];
        if (runtime.contains("preloadPackages") && runtime["preloadPackages"].is_array()) {
            config.runtime.preload_packages = ReadStringArray(runtime["preloadPackages"]);
        }
        if (runtime.contains("pythonPath") && runtime["pythonPath"].is_array()) {
            config.runtime.python_path = ReadStringArray(runtime["pythonPath"]);
        }
    }

    if (data.contains("executor") && data["executor"].is_object()) {
        const auto& executor = data["executor"];
        if (executor.contains("defaultTimeoutS") && executor["defaultTimeoutS"].is_number_integer()) {
            config.executor.default_timeout_s = executor["defaultTimeoutS"].get<int>();
        }
    }

    if (data.contains("filesystem") && data["filesystem"].is_object()) {
        const auto& filesystem = data["filesystem"];
        if (filesystem.contains("workdir") && filesystem["workdir"].is_string()) {
            config.filesystem.workdir = filesystem["workdir"].get<std::string>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }

    NormalizeConfig(config);
}

void ApplyEnvOverrides(Config& config) {
    // Set-but-empty means "preload nothing", so this one bypasses GetEnvFallback.
    const char* preload = std::getenv("PYSANDBOX_RUNTIME__PRELOAD_PACKAGES");
    if (!preload) {
        preload = std::getenv("PYSANDBOX_PRELOAD_PACKAGES");
    }
    if (preload) {
        config.runtime.preload_packages = utils::SplitCsv(preload);
    }

    const auto python_path = GetEnvFallback(
        "PYSANDBOX_RUNTIME__PYTHON_PATH",
        "PYSANDBOX_PYTHON_PATH");
    if (!python_path.empty()) {
        config.runtime.python_path = utils::SplitCsv(python_path);
    }

    const auto default_timeout = GetEnvFallback(
        "PYSANDBOX_EXECUTOR__DEFAULT_TIMEOUT_S",
        "PYSANDBOX_DEFAULT_TIMEOUT_S");
    if (!default_timeout.empty()) {
        config.executor.default_timeout_s = ParseInt(default_timeout, config.executor.default_timeout_s);
    }

    const auto workdir = GetEnvFallback(
        "PYSANDBOX_FILESYSTEM__WORKDIR",
        "PYSANDBOX_WORKDIR");
    if (!workdir.empty()) {
        config.filesystem.workdir = workdir;
    }

    const auto log_level = GetEnvFallback(
        "PYSANDBOX_LOGGING__LEVEL",
        "PYSANDBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    NormalizeConfig(config);
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "ignoring " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

}  // namespace pysandbox::config
