#pragma once

#include <cstddef>
#include <istream>
#include <string>

#include "executor/executor.hpp"
#include "filesystem/virtual_filesystem.hpp"
#include "protocol/messages.hpp"
#include "protocol/response_emitter.hpp"

namespace pysandbox::dispatcher {

enum class LoopExit {
    kEndOfInput,
    kTransportFailure
};

const char* ToString(LoopExit exit);

struct DispatchStats {
    std::size_t handled = 0;
    std::size_t failed = 0;
};

// Single-threaded read loop. Every non-blank input line gets exactly one
// result line; only EOF or a dead control channel ends the loop.
class RequestDispatcher {
public:
    RequestDispatcher(executor::Executor& executor,
                      const filesystem::VirtualFilesystem& filesystem,
                      protocol::ResponseEmitter& emitter);

    LoopExit Run(std::istream& input);

    // Decodes and executes one line. Only RuntimeInitError escapes.
    protocol::ExecutionResult HandleLine(const std::string& line);

    const DispatchStats& Stats() const { return stats_; }

private:
    protocol::ExecutionResult Dispatch(const protocol::Request& request);

    executor::Executor& executor_;
    const filesystem::VirtualFilesystem& filesystem_;
    protocol::ResponseEmitter& emitter_;
    DispatchStats stats_;
};

}  // namespace pysandbox::dispatcher
