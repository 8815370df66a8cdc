#pragma once

#include <atomic>

namespace appcast {

// Cooperative cancellation flag polled at suspension points.
class CancelToken {
public:
    void Cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    void Reset() { cancelled_.store(false, std::memory_order_relaxed); }
    bool IsCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic_bool cancelled_{false};
};

} // namespace appcast
