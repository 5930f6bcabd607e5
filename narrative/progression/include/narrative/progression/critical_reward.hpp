#pragma once

#include <narrative/core/settings.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace narrative::progression {

// ============================================================================
// Reward Tier - ordered, a grant may only move upward
// ============================================================================

enum class RewardTier : uint8_t {
    Base = 0,
    Technical = 1,
    Annotated = 2
};

const char* to_string(RewardTier tier);
std::optional<RewardTier> tier_from_string(const std::string& str);

// Tier earned by a session's final relationship score
RewardTier determine_tier(int32_t player_score, const core::DialogueSettings& settings);

// ============================================================================
// Critical Reward - one record per (save, reward)
// ============================================================================

struct CriticalReward {
    std::string id;
    bool granted = false;               // Never returns to false once set
    RewardTier granted_tier = RewardTier::Base;
    uint32_t attempts = 0;              // Persistence writes attempted
};

} // namespace narrative::progression
