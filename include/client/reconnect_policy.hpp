#ifndef RECONNECT_POLICY_HPP
#define RECONNECT_POLICY_HPP

#include <chrono>
#include <optional>

// Capped exponential backoff with a bounded number of attempts.
class ReconnectPolicy {
public:
    struct Config {
        int initialDelayMs = 500;
        double multiplier = 2.0;
        int maxDelayMs = 10000;
        int maxAttempts = 8;        // 0 retries forever
    };

    explicit ReconnectPolicy(Config config);

    // Delay before the next attempt, or nullopt once attempts are used up.
    std::optional<std::chrono::milliseconds> nextDelay();

    // Called after a successful connect.
    void reset() { attempts_ = 0; }

    int attempts() const { return attempts_; }
    bool exhausted() const { return config_.maxAttempts > 0 && attempts_ >= config_.maxAttempts; }

private:
    Config config_;
    int attempts_ = 0;
};

#endif
