#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/stream.hpp>

#include "config/config_loader.hpp"
#include "dispatcher/request_dispatcher.hpp"
#include "executor/executor.hpp"
#include "filesystem/virtual_filesystem.hpp"
#include "protocol/codec.hpp"
#include "protocol/response_emitter.hpp"
#include "runtime/python_interpreter.hpp"
#include "runtime/runtime_manager.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

constexpr const char* kVersion = "0.4.1";

constexpr int kExitTransportFailure = 1;
constexpr int kExitRuntimeFailure = 2;

namespace bio = boost::iostreams;

void IgnoreSigpipe() {
    // A vanished reader must show up as a failed write, not kill the worker.
    struct sigaction action {};
    action.sa_handler = SIG_IGN;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGPIPE, &action, nullptr);
}

bool EnterWorkdir(const std::string& workdir) {
    if (workdir.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(workdir, ec);
    if (ec) {
        pysandbox::utils::LogError("worker", "cannot create workdir " + workdir + ": " + ec.message());
        return false;
    }
    std::filesystem::current_path(workdir, ec);
    if (ec) {
        pysandbox::utils::LogError("worker", "cannot enter workdir " + workdir + ": " + ec.message());
        return false;
    }
    return true;
}

std::unique_ptr<pysandbox::runtime::RuntimeManager> StartRuntime(
    const pysandbox::config::Config& config) {
    pysandbox::utils::LogInfo(
        "worker",
        "preloading packages: " + (config.runtime.preload_packages.empty()
                                       ? std::string("(none)")
                                       : pysandbox::utils::Join(config.runtime.preload_packages, ", ")));
    auto runtime = std::make_unique<pysandbox::runtime::RuntimeManager>(
        std::make_unique<pysandbox::runtime::PythonInterpreter>(config.runtime));
    runtime->Initialize();
    return runtime;
}

int RunServe(const pysandbox::config::Config& config) {
    // Claim the protocol stream, then send fd 1 to stderr so C-level writes
    // from guest extensions land in diagnostics.
    const int protocol_fd = ::dup(STDOUT_FILENO);
    if (protocol_fd < 0 || ::dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        pysandbox::utils::LogError("worker", "failed to set up protocol stream");
        return kExitTransportFailure;
    }
    bio::stream<bio::file_descriptor_sink> protocol_out(protocol_fd, bio::close_handle);

    pysandbox::utils::LogInfo("worker", "starting persistent python sandbox worker");
    std::unique_ptr<pysandbox::runtime::RuntimeManager> runtime;
    try {
        runtime = StartRuntime(config);
    } catch (const std::exception& ex) {
        pysandbox::utils::LogError("worker", std::string("runtime failed to start: ") + ex.what());
        return kExitRuntimeFailure;
    }
    pysandbox::utils::LogInfo("worker", "python sandbox worker ready");

    pysandbox::filesystem::VirtualFilesystem filesystem;
    pysandbox::executor::Executor executor(*runtime, filesystem, config.executor);
    pysandbox::protocol::ResponseEmitter emitter(protocol_out);
    pysandbox::dispatcher::RequestDispatcher dispatcher(executor, filesystem, emitter);

    pysandbox::dispatcher::LoopExit exit = pysandbox::dispatcher::LoopExit::kEndOfInput;
    try {
        exit = dispatcher.Run(std::cin);
    } catch (const pysandbox::runtime::RuntimeInitError& ex) {
        pysandbox::utils::LogError("worker", std::string("runtime failed: ") + ex.what());
        return kExitRuntimeFailure;
    }

    const auto& stats = dispatcher.Stats();
    pysandbox::utils::LogInfo(
        "worker",
        std::string("shutting down reason=") + pysandbox::dispatcher::ToString(exit) +
            " handled=" + std::to_string(stats.handled) +
            " failed=" + std::to_string(stats.failed));
    return exit == pysandbox::dispatcher::LoopExit::kEndOfInput ? 0 : kExitTransportFailure;
}

int RunOnce(const pysandbox::config::Config& config, const std::string& code) {
    std::unique_ptr<pysandbox::runtime::RuntimeManager> runtime;
    try {
        runtime = StartRuntime(config);
    } catch (const std::exception& ex) {
        pysandbox::utils::LogError("worker", std::string("runtime failed to start: ") + ex.what());
        return kExitRuntimeFailure;
    }
    pysandbox::filesystem::VirtualFilesystem filesystem;
    pysandbox::executor::Executor executor(*runtime, filesystem, config.executor);

    pysandbox::protocol::ExecuteRequest request{};
    request.code = code;
    const auto result = executor.Execute(request);
    std::cout << pysandbox::protocol::SerializeResult(result) << std::endl;
    return result.success ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "--version") {
        std::cout << "pysandbox_worker " << kVersion << std::endl;
        return 0;
    }

    IgnoreSigpipe();
    const auto config = pysandbox::config::LoadConfig();
    pysandbox::utils::LogConfig log_config{};
    log_config.min_level = pysandbox::utils::ParseLogLevel(config.logging.level);
    pysandbox::utils::SetLogConfig(log_config);

    if (!EnterWorkdir(config.filesystem.workdir)) {
        return kExitRuntimeFailure;
    }

    if (argc >= 3 && std::string(argv[1]) == "exec") {
        return RunOnce(config, argv[2]);
    }

    if (argc == 1 || (argc == 2 && std::string(argv[1]) == "serve")) {
        return RunServe(config);
    }

    std::cerr << "Usage: pysandbox_worker [serve] | pysandbox_worker exec \"<code>\" | pysandbox_worker --version"
              << std::endl;
    return 1;
}
