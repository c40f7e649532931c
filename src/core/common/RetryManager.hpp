#pragma once

#include <QtCore/QElapsedTimer>
#include <QtCore/QThread>
#include <chrono>
#include <functional>
#include "CancellationToken.hpp"
#include "Expected.hpp"

namespace ReelSync {

enum class RetryError {
    MaxAttemptsExceeded,
    NonRetryableError,
    Cancelled
};

// Exponential backoff: initialDelay * backoffMultiplier^(attempt - 1), capped at maxDelay
struct RetryConfig {
    int maxAttempts = 3;
    std::chrono::milliseconds initialDelay{500};
    std::chrono::milliseconds maxDelay{10000};
    double backoffMultiplier = 2.0;
    double jitterFactor = 0.1;
    bool enableJitter = true;
};

/**
 * @brief Synchronous retry loop with exponential backoff
 *
 * Runs an operation until it succeeds, reports a non-retryable error, or
 * the attempt budget is spent. The calling thread sleeps between attempts;
 * the sleep ends early once the cancellation token is set.
 */
class RetryManager {
public:
    RetryManager(const RetryConfig& config, const CancellationToken& token);

    template<typename T, typename ErrorType>
    Expected<T, RetryError> execute(
        const std::function<Expected<T, ErrorType>()>& operation,
        const std::function<bool(const ErrorType&)>& isRetryable = nullptr
    );

    int getCurrentAttempt() const { return currentAttempt_; }
    std::chrono::milliseconds calculateDelayForAttempt(int attempt) const;

private:
    void sleepFor(std::chrono::milliseconds delay);

    RetryConfig config_;
    const CancellationToken& token_;
    int currentAttempt_ = 0;
};

template<typename T, typename ErrorType>
Expected<T, RetryError> RetryManager::execute(
    const std::function<Expected<T, ErrorType>()>& operation,
    const std::function<bool(const ErrorType&)>& isRetryable
) {
    const int attempts = config_.maxAttempts < 1 ? 1 : config_.maxAttempts;
    for (currentAttempt_ = 1; currentAttempt_ <= attempts; ++currentAttempt_) {
        if (token_.isCancelled()) {
            return makeUnexpected(RetryError::Cancelled);
        }

        auto result = operation();
        if (result.hasValue()) {
            return std::move(result).value();
        }

        if (isRetryable && !isRetryable(result.error())) {
            return makeUnexpected(token_.isCancelled() ? RetryError::Cancelled : RetryError::NonRetryableError);
        }

        if (currentAttempt_ < attempts) {
            sleepFor(calculateDelayForAttempt(currentAttempt_));
        }
    }

    if (token_.isCancelled()) {
        return makeUnexpected(RetryError::Cancelled);
    }
    return makeUnexpected(RetryError::MaxAttemptsExceeded);
}

namespace RetryConfigs {
    // Head-sample probe: a handful of quick attempts before giving up
    inline RetryConfig probe(int attempts, std::chrono::milliseconds delay) {
        RetryConfig config;
        config.maxAttempts = attempts;
        config.initialDelay = delay;
        config.maxDelay = std::chrono::milliseconds(10000);
        return config;
    }
}

} // namespace ReelSync
