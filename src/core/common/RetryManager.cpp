#include "RetryManager.hpp"
#include "Logger.hpp"
#include <QtCore/QRandomGenerator>
#include <algorithm>
#include <cmath>

namespace ReelSync {

namespace {
// Sleep in short slices so a cancelled token takes effect during long backoffs
constexpr std::chrono::milliseconds kSleepSlice{50};
}

RetryManager::RetryManager(const RetryConfig& config, const CancellationToken& token)
    : config_(config)
    , token_(token) {
}

std::chrono::milliseconds RetryManager::calculateDelayForAttempt(int attempt) const {
    double multiplier = std::pow(config_.backoffMultiplier, std::max(0, attempt - 1));
    std::chrono::milliseconds delay(static_cast<long long>(config_.initialDelay.count() * multiplier));

    if (config_.enableJitter && config_.jitterFactor > 0.0 && delay.count() > 0) {
        double jitterRange = delay.count() * config_.jitterFactor;
        double jitter = (QRandomGenerator::global()->generateDouble() - 0.5) * 2.0 * jitterRange;
        delay = std::chrono::milliseconds(
            static_cast<long long>(std::max(0.0, delay.count() + jitter)));
    }

    if (delay > config_.maxDelay) {
        delay = config_.maxDelay;
    }
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }

    return delay;
}

void RetryManager::sleepFor(std::chrono::milliseconds delay) {
    REELSYNC_DEBUG("Retrying attempt {} in {}ms", currentAttempt_ + 1, delay.count());

    QElapsedTimer slept;
    slept.start();
    while (!token_.isCancelled() && slept.elapsed() < delay.count()) {
        auto remaining = delay.count() - slept.elapsed();
        QThread::msleep(static_cast<unsigned long>(std::min<long long>(remaining, kSleepSlice.count())));
    }
}

} // namespace ReelSync
