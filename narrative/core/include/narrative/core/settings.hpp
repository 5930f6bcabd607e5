#pragma once

#include <string>
#include <cstdint>

namespace narrative::core {

struct EventBusSettings {
    uint32_t history_capacity = 256;   // 0 disables the diagnostics ring buffer
};

struct DialogueSettings {
    uint32_t default_max_visits = 1;
    uint32_t backstory_max_visits = 3;
    uint32_t max_transitions = 256;    // Hard cap per session
    int annotated_tier_score = 3;      // Player score at or above -> Annotated
    int technical_tier_score = 0;      // Player score at or above -> Technical
};

struct EconomySettings {
    int insight_min = 0;
    int insight_max = 100;
    int momentum_min = 0;
    int momentum_max = 3;

    int reframe_cost = 25;
    int extrapolate_cost = 50;
    int synthesis_cost = 75;
    int extrapolate_momentum = 2;      // Momentum required for extrapolate

    double momentum_insight_bonus = 0.25;  // Insight multiplier per momentum point
};

struct RetrySettings {
    uint32_t max_attempts = 3;
    float initial_delay = 0.25f;       // Seconds before the first retry
    float backoff_multiplier = 2.0f;
};

struct NarrativeSettings {
    EventBusSettings event_bus;
    DialogueSettings dialogue;
    EconomySettings economy;
    RetrySettings retry;

    // Process-wide instance used by the CLI
    static NarrativeSettings& get();

    // Load settings from JSON file. Keys not present keep their current value.
    bool load(const std::string& path);

    // Save settings to JSON file
    bool save(const std::string& path) const;

    // Reset to defaults
    void reset();
};

} // namespace narrative::core
