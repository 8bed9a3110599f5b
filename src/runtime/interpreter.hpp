#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "runtime/cancellation.hpp"

namespace pysandbox::runtime {

enum class RunStatus {
    kCompleted,
    kTimedOut,
    kFailed
};

struct RunOutcome {
    RunStatus status = RunStatus::kFailed;
    // Textual form of a non-None trailing expression.
    std::optional<std::string> value;
    // Exception class name, e.g. "ZeroDivisionError".
    std::string error_type;
    // Formatted traceback.
    std::string error;
};

struct CapturedOutput {
    std::string out;
    std::string err;
};

class RuntimeInitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A hosted guest-language engine. Every method except Interrupt() is called
// from the worker thread only.
class Interpreter {
public:
    virtual ~Interpreter() = default;

    // Expensive one-time setup. Throws RuntimeInitError.
    virtual void Initialize() = 0;

    virtual void InstallCapture() = 0;
    // Must tolerate buffers that were never installed.
    virtual CapturedOutput RestoreCapture() noexcept = 0;

    // Runs code in the persistent namespace. The token is polled at the
    // engine's own checkpoints; kTimedOut means the token was observed.
    virtual RunOutcome Run(const std::string& code, const CancellationToken& token) = 0;

    // Thread-safe. Asks the active Run() to stop at its next checkpoint.
    virtual void Interrupt() = 0;

    // Makes any interrupt still in flight a no-op.
    virtual void DisarmInterrupt() noexcept = 0;
};

}  // namespace pysandbox::runtime
