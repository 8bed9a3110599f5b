#pragma once

#include "runtime/interpreter.hpp"

namespace pysandbox::capture {

// Redirects the interpreter's stdout/stderr into buffers for one request.
// Restore() runs exactly once: explicitly, or from the destructor if the
// request unwound before reaching it.
class OutputCapture {
public:
    explicit OutputCapture(runtime::Interpreter& interpreter);
    ~OutputCapture();

    OutputCapture(const OutputCapture&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;

    void Install();

    // Returns empty buffers when not installed or already restored.
    runtime::CapturedOutput Restore() noexcept;

    bool Installed() const { return installed_; }

private:
    runtime::Interpreter& interpreter_;
    bool installed_ = false;
};

}  // namespace pysandbox::capture
