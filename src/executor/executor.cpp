#include "executor/executor.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <utility>

#include "capture/output_capture.hpp"
#include "executor/deadline_timer.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::executor {
namespace {

// Keeps the millisecond conversion well inside range.
constexpr double kMaxTimerSeconds = 365.0 * 24 * 60 * 60;

const char* ToString(runtime::RunStatus status) {
    switch (status) {
        case runtime::RunStatus::kCompleted: return "completed";
        case runtime::RunStatus::kTimedOut: return "timed_out";
        case runtime::RunStatus::kFailed: return "failed";
    }
    return "unknown";
}

}  // namespace

bool IsNativeErrorKind(const std::string& type) {
    static const std::array<const char*, 9> kNativeKinds = {
        "SyntaxError",
        "IndentationError",
        "NameError",
        "TypeError",
        "ValueError",
        "AttributeError",
        "KeyError",
        "IndexError",
        "ZeroDivisionError"
    };
    return std::any_of(kNativeKinds.begin(), kNativeKinds.end(), [&type](const char* kind) {
        return type == kind;
    });
}

std::string ClassifyGuestError(const runtime::RunOutcome& outcome) {
    if (IsNativeErrorKind(outcome.error_type)) {
        return outcome.error;
    }
    return "PythonError: " + outcome.error;
}

void AppendTrailingValue(std::string& output, const std::string& value) {
    if (!output.empty() && output.back() != '\n') {
        output += '\n';
    }
    output += value;
}

std::string TimeoutMessage(double seconds) {
    return "Execution timed out after " + utils::FormatSeconds(seconds) + " seconds";
}

Executor::Executor(runtime::RuntimeManager& runtime,
                   const filesystem::VirtualFilesystem& filesystem,
                   config::ExecutorConfig config)
    : runtime_(runtime)
    , filesystem_(filesystem)
    , config_(std::move(config)) {
    if (config_.default_timeout_s <= 0) {
        config_.default_timeout_s = config::kDefaultTimeoutSeconds;
    }
}

double Executor::EffectiveTimeout(const protocol::ExecuteRequest& request) const {
    if (!request.timeout_seconds.has_value()) {
        return static_cast<double>(config_.default_timeout_s);
    }
    const auto requested = *request.timeout_seconds;
    if (!std::isfinite(requested) || requested <= 0.0) {
        return static_cast<double>(config_.default_timeout_s);
    }
    return requested;
}

void Executor::StageFiles(const std::map<std::string, std::string>& files,
                          std::vector<std::string>& logs) const {
    for (const auto& [path, content] : files) {
        const auto written = filesystem_.WriteFile(path, content);
        if (written.ok) {
            logs.push_back("Wrote file: " + path);
        } else {
            utils::LogWarn("executor", written.error);
            logs.push_back(written.error);
        }
    }
}

protocol::ExecutionResult Executor::Execute(const protocol::ExecuteRequest& request) {
    protocol::ExecutionResult result{};
    auto& interpreter = runtime_.Acquire();
    const auto timeout = EffectiveTimeout(request);
    const auto started = std::chrono::steady_clock::now();

    capture::OutputCapture capture(interpreter);
    runtime::CancellationToken token;
    runtime::RunOutcome outcome{};
    try {
        capture.Install();
        StageFiles(request.files, result.logs);

        const auto timer_ms = std::chrono::milliseconds(
            static_cast<long long>(std::min(timeout, kMaxTimerSeconds) * 1000.0));
        DeadlineTimer timer(timer_ms, [&token, &interpreter]() {
            token.Cancel();
            interpreter.Interrupt();
        });
        outcome = interpreter.Run(request.code, token);
        timer.Cancel();
    } catch (const std::exception& ex) {
        interpreter.DisarmInterrupt();
        const auto captured = capture.Restore();
        result.output = captured.out;
        if (!captured.err.empty()) {
            result.logs.push_back(captured.err);
        }
        result.error = std::string("Sandbox execution failed: ") + ex.what();
        utils::LogError("executor", *result.error);
        return result;
    }

    interpreter.DisarmInterrupt();
    const auto captured = capture.Restore();
    result.output = captured.out;
    if (!captured.err.empty()) {
        result.logs.push_back(captured.err);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    const auto status = token.IsCancelled() ? runtime::RunStatus::kTimedOut : outcome.status;
    utils::LogDebug("executor", std::string("run finished status=") + ToString(status) +
                                " elapsed=" + std::to_string(elapsed.count()) + "ms");

    switch (status) {
        case runtime::RunStatus::kTimedOut:
            result.error = TimeoutMessage(timeout);
            utils::LogWarn("executor", *result.error);
            break;
        case runtime::RunStatus::kFailed:
            result.error = ClassifyGuestError(outcome);
            break;
        case runtime::RunStatus::kCompleted:
            result.success = true;
            if (outcome.value.has_value()) {
                AppendTrailingValue(result.output, *outcome.value);
            }
            break;
    }
    return result;
}

}  // namespace pysandbox::executor
