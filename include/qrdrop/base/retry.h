#ifndef QRDROP_BASE_RETRY_H
#define QRDROP_BASE_RETRY_H

#include "qrdrop/base/error_code.h"
#include "qrdrop/base/logger.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>

namespace qrdrop {

// Retry policy for one class of operation
struct RetryConfig {
    uint32_t max_retries = 3;  // total attempts, including the first
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;
    bool use_jitter = true;

    static RetryConfig network();
    static RetryConfig file_system();
    static RetryConfig qr_code();
    static RetryConfig server();

    // Constant delay between attempts, no jitter
    static RetryConfig fixed(uint32_t max_retries, std::chrono::milliseconds delay);
};

using RetryPredicate = std::function<bool(const QrDropError&)>;
using RetryCallback = std::function<void(uint32_t attempt, const QrDropError&)>;
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

bool default_should_retry(const QrDropError& error);
void default_sleep(std::chrono::milliseconds delay);

// jitter_sample is in [0, 1); the delay grows by at most 10% of its value.
std::chrono::milliseconds compute_retry_delay(std::chrono::milliseconds current_delay,
                                              const RetryConfig& config,
                                              double jitter_sample);
double random_jitter_sample();

// Runs operation until it returns, the error is not retryable, or max_retries
// attempts have been made. Only QrDropError is considered; anything else propagates.
template<typename Operation>
auto retry_execute(Operation&& operation,
                   const RetryConfig& config,
                   const RetryPredicate& should_retry = default_should_retry,
                   const RetryCallback& on_retry = {},
                   const SleepFunction& sleep = default_sleep) -> decltype(operation()) {
    const uint32_t max_attempts = std::max<uint32_t>(config.max_retries, 1);
    std::chrono::milliseconds current_delay = config.initial_delay;
    uint32_t attempts = 0;

    while (true) {
        ++attempts;
        if (attempts > 1) {
            Logger::instance().info("Retry attempt {}/{}", attempts, max_attempts);
        }
        try {
            return operation();
        } catch (const QrDropError& e) {
            if (!should_retry(e) || attempts >= max_attempts) {
                throw;
            }
            if (on_retry) {
                on_retry(attempts, e);
            }

            auto delay = compute_retry_delay(
                current_delay, config, config.use_jitter ? random_jitter_sample() : 0.0);
            Logger::instance().warning("Attempt {} failed ({}), waiting {}ms before retry",
                                       attempts, e.what(), delay.count());
            sleep(delay);

            current_delay = std::chrono::milliseconds(static_cast<int64_t>(
                static_cast<double>(current_delay.count()) * config.backoff_multiplier + 0.5));
        }
    }
}

} // namespace qrdrop

#endif // QRDROP_BASE_RETRY_H
