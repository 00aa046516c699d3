#include "client/reconnect_policy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

// Constructor
ReconnectPolicy::ReconnectPolicy(Config config) : config_(config) {
    if (config_.initialDelayMs <= 0 || config_.maxDelayMs < config_.initialDelayMs) {
        throw std::invalid_argument("reconnect delays must be positive and initial <= max");
    }
    if (config_.multiplier < 1.0) throw std::invalid_argument("reconnect multiplier must be >= 1");
    if (config_.maxAttempts < 0) throw std::invalid_argument("reconnect attempts must be >= 0");
}

std::optional<std::chrono::milliseconds> ReconnectPolicy::nextDelay() {
    if (exhausted()) return std::nullopt;

    const double raw = config_.initialDelayMs * std::pow(config_.multiplier, attempts_);
    const double capped = std::min(raw, static_cast<double>(config_.maxDelayMs));
    ++attempts_;
    return std::chrono::milliseconds(static_cast<long long>(capped));
}
