#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace pysandbox::executor {

// Fires on_expire once on a helper thread unless cancelled first.
class DeadlineTimer {
public:
    DeadlineTimer(std::chrono::milliseconds timeout, std::function<void()> on_expire);
    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    // Stops and joins the timer thread. Returns true if it already fired.
    // A fire racing with Cancel() has finished by the time this returns.
    bool Cancel();

    bool Fired() const;

private:
    void RunLoop(std::chrono::steady_clock::time_point deadline);

    std::function<void()> on_expire_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    bool fired_ = false;
    std::thread worker_;
};

}  // namespace pysandbox::executor
