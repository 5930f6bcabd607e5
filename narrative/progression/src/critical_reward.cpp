#include <narrative/progression/critical_reward.hpp>

namespace narrative::progression {

const char* to_string(RewardTier tier) {
    switch (tier) {
        case RewardTier::Base:      return "base";
        case RewardTier::Technical: return "technical";
        case RewardTier::Annotated: return "annotated";
    }
    return "base";
}

std::optional<RewardTier> tier_from_string(const std::string& str) {
    if (str == "base") return RewardTier::Base;
    if (str == "technical") return RewardTier::Technical;
    if (str == "annotated") return RewardTier::Annotated;
    return std::nullopt;
}

RewardTier determine_tier(int32_t player_score, const core::DialogueSettings& settings) {
    if (player_score >= settings.annotated_tier_score) return RewardTier::Annotated;
    if (player_score >= settings.technical_tier_score) return RewardTier::Technical;
    return RewardTier::Base;
}

} // namespace narrative::progression
