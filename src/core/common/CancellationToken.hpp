#pragma once

#include <atomic>

namespace ReelSync {

/**
 * @brief Cooperative stop flag handed to long-running sync calls
 *
 * cancel() only stores to a lock-free atomic, so it may be called from a
 * signal handler. Holders poll isCancelled() between bounded I/O steps.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }
    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
    static_assert(std::atomic<bool>::is_always_lock_free, "cancel() must be async-signal-safe");
};

} // namespace ReelSync
