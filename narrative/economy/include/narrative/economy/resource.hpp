#pragma once

#include <string>
#include <cstdint>

namespace narrative::economy {

// ============================================================================
// Resource - bounded integer value owned by the ResourceEconomy
// ============================================================================

struct Resource {
    std::string id;
    int32_t value = 0;
    int32_t min = 0;
    int32_t max = 0;
    int32_t initial = 0;        // Restored by ResourceEconomy::reset()

    bool is_at_min() const { return value <= min; }
    bool is_at_max() const { return value >= max; }

    float get_percent() const {
        if (max == min) return 0.0f;
        return static_cast<float>(value - min) / static_cast<float>(max - min);
    }
};

// ============================================================================
// Threshold - action-unlock boundary on a resource
// ============================================================================

struct Threshold {
    std::string resource_id;
    int32_t value = 0;
    std::string label;
    int32_t nearby_range = 0;   // Width of the "approaching" band below value
};

// ============================================================================
// ChoiceQuality - how a dialogue choice affects the momentum streak
// ============================================================================

enum class ChoiceQuality : uint8_t {
    Auto,           // Derived by the caller (sign of relationship change)
    Optimal,        // Extends the streak
    Neutral,        // Leaves momentum alone
    NonOptimal      // Breaks the streak
};

const char* to_string(ChoiceQuality quality);
ChoiceQuality choice_quality_from_string(const std::string& str);

} // namespace narrative::economy
