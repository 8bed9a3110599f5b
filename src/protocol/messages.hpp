#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pysandbox::protocol {

struct ExecuteRequest {
    std::string code;
    std::map<std::string, std::string> files;
    // Raw value from the wire; the executor applies the default.
    std::optional<double> timeout_seconds;
};

struct WriteFileRequest {
    std::string path;
    std::string content;
};

struct ReadFileRequest {
    std::string path;
};

using Request = std::variant<ExecuteRequest, WriteFileRequest, ReadFileRequest>;

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::optional<std::string> error;
    std::vector<std::string> logs;

    static ExecutionResult Success(std::string output) {
        ExecutionResult result{};
        result.success = true;
        result.output = std::move(output);
        return result;
    }

    static ExecutionResult Failure(std::string error) {
        ExecutionResult result{};
        result.error = std::move(error);
        return result;
    }
};

// A request line that cannot be decoded. The session continues.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The control channel is gone. The loop must stop.
class FatalTransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace pysandbox::protocol
