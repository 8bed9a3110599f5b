#include "dispatcher/request_dispatcher.hpp"

#include <type_traits>
#include <variant>

#include "protocol/codec.hpp"
#include "utils/logging.hpp"

namespace pysandbox::dispatcher {
namespace {

bool IsBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

const char* ToString(LoopExit exit) {
    switch (exit) {
        case LoopExit::kEndOfInput: return "end_of_input";
        case LoopExit::kTransportFailure: return "transport_failure";
    }
    return "unknown";
}

RequestDispatcher::RequestDispatcher(executor::Executor& executor,
                                     const filesystem::VirtualFilesystem& filesystem,
                                     protocol::ResponseEmitter& emitter)
    : executor_(executor)
    , filesystem_(filesystem)
    , emitter_(emitter) {}

LoopExit RequestDispatcher::Run(std::istream& input) {
    std::string line;
    while (true) {
        if (!std::getline(input, line)) {
            if (input.bad()) {
                utils::LogError("dispatcher", "input stream failed, exiting");
                return LoopExit::kTransportFailure;
            }
            utils::LogInfo("dispatcher", "stdin closed, exiting");
            return LoopExit::kEndOfInput;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (IsBlank(line)) {
            continue;
        }

        auto result = HandleLine(line);
        try {
            emitter_.Emit(result);
        } catch (const protocol::FatalTransportError& ex) {
            utils::LogError("dispatcher", std::string("critical error, exiting: ") + ex.what());
            return LoopExit::kTransportFailure;
        }
    }
}

protocol::ExecutionResult RequestDispatcher::HandleLine(const std::string& line) {
    ++stats_.handled;
    protocol::ExecutionResult result{};
    try {
        const auto request = protocol::ParseRequest(line);
        result = Dispatch(request);
    } catch (const protocol::ProtocolError& ex) {
        utils::LogWarn("dispatcher", std::string("rejected request: ") + ex.what());
        result = protocol::ExecutionResult::Failure(
            std::string("Failed to process request: ") + ex.what());
    } catch (const runtime::RuntimeInitError&) {
        throw;
    } catch (const std::exception& ex) {
        utils::LogError("dispatcher", std::string("server error: ") + ex.what());
        result = protocol::ExecutionResult::Failure(std::string("Server error: ") + ex.what());
    }
    if (!result.success) {
        ++stats_.failed;
    }
    return result;
}

protocol::ExecutionResult RequestDispatcher::Dispatch(const protocol::Request& request) {
    return std::visit([this](const auto& typed) -> protocol::ExecutionResult {
        using T = std::decay_t<decltype(typed)>;
        if constexpr (std::is_same_v<T, protocol::WriteFileRequest>) {
            const auto written = filesystem_.WriteFile(typed.path, typed.content);
            if (!written.ok) {
                return protocol::ExecutionResult::Failure("Failed to write file: " + written.error);
            }
            utils::LogDebug("dispatcher", "wrote " + typed.path);
            return protocol::ExecutionResult::Success("File written to " + typed.path);
        } else if constexpr (std::is_same_v<T, protocol::ReadFileRequest>) {
            const auto read = filesystem_.ReadFile(typed.path);
            if (!read.ok) {
                return protocol::ExecutionResult::Failure("Failed to read file: " + read.error);
            }
            return protocol::ExecutionResult::Success(read.content);
        } else {
            if (typed.code.empty()) {
                return protocol::ExecutionResult::Failure("No code provided for execution");
            }
            return executor_.Execute(typed);
        }
    }, request);
}

}  // namespace pysandbox::dispatcher
