#include "executor/deadline_timer.hpp"

#include <utility>

#include "utils/logging.hpp"

namespace pysandbox::executor {

DeadlineTimer::DeadlineTimer(std::chrono::milliseconds timeout, std::function<void()> on_expire)
    : on_expire_(std::move(on_expire)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    worker_ = std::thread([this, deadline]() { RunLoop(deadline); });
}

DeadlineTimer::~DeadlineTimer() {
    Cancel();
}

bool DeadlineTimer::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    return Fired();
}

bool DeadlineTimer::Fired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

void DeadlineTimer::RunLoop(std::chrono::steady_clock::time_point deadline) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_until(lock, deadline, [this] { return cancelled_; })) {
            return;
        }
        fired_ = true;
    }
    if (!on_expire_) {
        return;
    }
    try {
        on_expire_();
    } catch (const std::exception& ex) {
        utils::LogError("executor", std::string("deadline handler failed: ") + ex.what());
    }
}

}  // namespace pysandbox::executor
