#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>

#include "runtime/interpreter.hpp"

namespace pysandbox::runtime {

enum class RuntimeState {
    kUninitialized,
    kInitializing,
    kReady
};

const char* ToString(RuntimeState state);

// Owns the single warm interpreter for the life of the process. Guest state
// is never reset between requests.
class RuntimeManager {
public:
    explicit RuntimeManager(std::unique_ptr<Interpreter> interpreter);

    RuntimeManager(const RuntimeManager&) = delete;
    RuntimeManager& operator=(const RuntimeManager&) = delete;

    // Idempotent. Concurrent callers wait for the first one to finish.
    // Rethrows the interpreter's failure; state returns to kUninitialized.
    void Initialize();

    RuntimeState State() const;

    // Initializes inline on first use.
    Interpreter& Acquire();

private:
    std::unique_ptr<Interpreter> interpreter_;
    mutable std::mutex mutex_;
    std::condition_variable ready_cv_;
    RuntimeState state_ = RuntimeState::kUninitialized;
};

}  // namespace pysandbox::runtime
