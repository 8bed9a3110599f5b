#include "runtime/runtime_manager.hpp"

#include <chrono>
#include <utility>

#include "utils/logging.hpp"

namespace pysandbox::runtime {

const char* ToString(RuntimeState state) {
    switch (state) {
        case RuntimeState::kUninitialized: return "uninitialized";
        case RuntimeState::kInitializing: return "initializing";
        case RuntimeState::kReady: return "ready";
    }
    return "unknown";
}

RuntimeManager::RuntimeManager(std::unique_ptr<Interpreter> interpreter)
    : interpreter_(std::move(interpreter)) {
    if (!interpreter_) {
        throw RuntimeInitError("runtime manager requires an interpreter");
    }
}

void RuntimeManager::Initialize() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_cv_.wait(lock, [this] { return state_ != RuntimeState::kInitializing; });
        if (state_ == RuntimeState::kReady) {
            return;
        }
        state_ = RuntimeState::kInitializing;
    }

    utils::LogInfo("runtime", "initializing interpreter");
    const auto started = std::chrono::steady_clock::now();
    try {
        interpreter_->Initialize();
    } catch (const std::exception& ex) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = RuntimeState::kUninitialized;
        }
        ready_cv_.notify_all();
        utils::LogError("runtime", std::string("initialization failed: ") + ex.what());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = RuntimeState::kReady;
    }
    ready_cv_.notify_all();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    utils::LogInfo("runtime", "interpreter ready in " + std::to_string(elapsed.count()) + "ms");
}

RuntimeState RuntimeManager::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Interpreter& RuntimeManager::Acquire() {
    if (State() != RuntimeState::kReady) {
        Initialize();
    }
    return *interpreter_;
}

}  // namespace pysandbox::runtime
