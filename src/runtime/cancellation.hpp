#pragma once

#include <atomic>

namespace pysandbox::runtime {

// Shared between the deadline timer and the interpreter for one run.
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace pysandbox::runtime
