#include "qrdrop/base/retry.h"
#include <cmath>
#include <random>
#include <thread>

namespace qrdrop {

RetryConfig RetryConfig::network() {
    RetryConfig config;
    config.max_retries = 3;
    config.initial_delay = std::chrono::seconds(2);
    config.max_delay = std::chrono::seconds(15);
    config.backoff_multiplier = 2.0;
    config.use_jitter = true;
    return config;
}

RetryConfig RetryConfig::file_system() {
    RetryConfig config;
    config.max_retries = 2;
    config.initial_delay = std::chrono::seconds(1);
    config.max_delay = std::chrono::seconds(5);
    config.backoff_multiplier = 1.5;
    config.use_jitter = false;
    return config;
}

RetryConfig RetryConfig::qr_code() {
    RetryConfig config;
    config.max_retries = 5;
    config.initial_delay = std::chrono::milliseconds(500);
    config.max_delay = std::chrono::seconds(3);
    config.backoff_multiplier = 1.5;
    config.use_jitter = true;
    return config;
}

RetryConfig RetryConfig::server() {
    RetryConfig config;
    config.max_retries = 3;
    config.initial_delay = std::chrono::seconds(1);
    config.max_delay = std::chrono::seconds(10);
    config.backoff_multiplier = 2.0;
    config.use_jitter = true;
    return config;
}

RetryConfig RetryConfig::fixed(uint32_t max_retries, std::chrono::milliseconds delay) {
    RetryConfig config;
    config.max_retries = max_retries;
    config.initial_delay = delay;
    config.max_delay = delay;
    config.backoff_multiplier = 1.0;
    config.use_jitter = false;
    return config;
}

bool default_should_retry(const QrDropError& error) {
    if (error.kind() == ErrorKind::Permission) {
        return false;
    }
    if (error.code() == ErrorCode::InsufficientStorage) {
        return false;
    }
    return error.retryable();
}

void default_sleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

std::chrono::milliseconds compute_retry_delay(std::chrono::milliseconds current_delay,
                                              const RetryConfig& config,
                                              double jitter_sample) {
    double delay_ms = static_cast<double>(current_delay.count());
    if (config.use_jitter) {
        delay_ms = std::round(delay_ms * (1.0 + std::clamp(jitter_sample, 0.0, 1.0) * 0.1));
    }
    auto delay = std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
    return std::min(delay, config.max_delay);
}

double random_jitter_sample() {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine);
}

} // namespace qrdrop
