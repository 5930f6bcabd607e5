#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace narrative::economy {

// ============================================================================
// StrategicAction - optional plays unlocked by insight and momentum
// ============================================================================

enum class StrategicAction : uint8_t {
    Reframe,        // Costs insight
    Extrapolate,    // Costs insight, needs momentum
    Synthesis,      // Costs insight
    Boast           // Needs max momentum; failing it breaks the streak
};

constexpr StrategicAction ALL_STRATEGIC_ACTIONS[] = {
    StrategicAction::Reframe,
    StrategicAction::Extrapolate,
    StrategicAction::Synthesis,
    StrategicAction::Boast
};

const char* to_string(StrategicAction action);
std::optional<StrategicAction> strategic_action_from_string(const std::string& str);

// Outcome of activate/complete/cancel
struct ActionResult {
    bool success = false;
    StrategicAction action = StrategicAction::Reframe;
    int32_t insight_spent = 0;
    int32_t insight_refunded = 0;
    std::string error;
};

} // namespace narrative::economy
