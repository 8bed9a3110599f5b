#pragma once

#include <map>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "filesystem/virtual_filesystem.hpp"
#include "protocol/messages.hpp"
#include "runtime/runtime_manager.hpp"

namespace pysandbox::executor {

// Exception kinds whose traceback is returned verbatim.
bool IsNativeErrorKind(const std::string& type);

// Verbatim traceback for native kinds, "PythonError: ..." otherwise.
std::string ClassifyGuestError(const runtime::RunOutcome& outcome);

// Appends a trailing expression value, newline-separated when needed.
void AppendTrailingValue(std::string& output, const std::string& value);

std::string TimeoutMessage(double seconds);

// Runs one execute request end to end: capture, staging, bounded run,
// classification, restore. Never throws for guest or staging failures;
// RuntimeInitError still propagates.
class Executor {
public:
    Executor(runtime::RuntimeManager& runtime,
             const filesystem::VirtualFilesystem& filesystem,
             config::ExecutorConfig config);

    protocol::ExecutionResult Execute(const protocol::ExecuteRequest& request);

    // Absent, non-positive or non-finite values use the configured default.
    double EffectiveTimeout(const protocol::ExecuteRequest& request) const;

private:
    void StageFiles(const std::map<std::string, std::string>& files,
                    std::vector<std::string>& logs) const;

    runtime::RuntimeManager& runtime_;
    const filesystem::VirtualFilesystem& filesystem_;
    config::ExecutorConfig config_;
};

}  // namespace pysandbox::executor
