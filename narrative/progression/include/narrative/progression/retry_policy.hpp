#pragma once

#include <narrative/core/settings.hpp>
#include <cmath>
#include <cstdint>

namespace narrative::progression {

// Bounded retry schedule for persistence writes
struct RetryPolicy {
    uint32_t max_attempts = 3;          // Including the first write; 1 disables retries
    float initial_delay = 0.25f;
    float backoff_multiplier = 2.0f;

    static RetryPolicy from_settings(const core::RetrySettings& settings) {
        RetryPolicy policy;
        policy.max_attempts = settings.max_attempts;
        policy.initial_delay = settings.initial_delay;
        policy.backoff_multiplier = settings.backoff_multiplier;
        return policy;
    }

    // Delay before the retry that follows failed attempt `attempt` (1-based)
    float delay_for(uint32_t attempt) const {
        if (attempt <= 1) return initial_delay;
        return initial_delay * std::pow(backoff_multiplier, static_cast<float>(attempt - 1));
    }

    bool allows_retry_after(uint32_t attempt) const {
        return attempt < max_attempts;
    }
};

} // namespace narrative::progression
