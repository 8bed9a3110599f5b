#pragma once

#include <string>
#include <vector>

namespace pysandbox::config {

constexpr int kDefaultTimeoutSeconds = 30;

struct RuntimeConfig {
    std::vector<std::string> preload_packages = {"numpy", "pandas", "matplotlib"};
    std::vector<std::string> python_path;
};

struct ExecutorConfig {
    int default_timeout_s = kDefaultTimeoutSeconds;
};

struct FilesystemConfig {
    std::string workdir;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    RuntimeConfig runtime;
    ExecutorConfig executor;
    FilesystemConfig filesystem;
    LoggingConfig logging;
};

}  // namespace pysandbox::config
