#include <narrative/dialogue/dialogue_state.hpp>

namespace narrative::dialogue {

const char* to_string(StateKind kind) {
    switch (kind) {
        case StateKind::Intro:          return "intro";
        case StateKind::Question:       return "question";
        case StateKind::Response:       return "response";
        case StateKind::Backstory:      return "backstory";
        case StateKind::CriticalMoment: return "critical-moment";
        case StateKind::Conclusion:     return "conclusion";
        case StateKind::Transition:     return "transition";
    }
    return "question";
}

std::optional<StateKind> state_kind_from_string(const std::string& str) {
    if (str == "intro") return StateKind::Intro;
    if (str == "question") return StateKind::Question;
    if (str == "response") return StateKind::Response;
    if (str == "backstory") return StateKind::Backstory;
    if (str == "critical-moment" || str == "critical_moment") return StateKind::CriticalMoment;
    if (str == "conclusion") return StateKind::Conclusion;
    if (str == "transition") return StateKind::Transition;
    return std::nullopt;
}

// ============================================================================
// Dialogue Condition Evaluation
// ============================================================================

bool DialogueCondition::evaluate(const DialogueContext& context) const {
    bool result = true;

    if (min_score && context.player_score < *min_score) result = false;
    if (max_score && context.player_score > *max_score) result = false;

    for (const auto& state_id : requires_visited) {
        if (!context.has_visited(state_id)) result = false;
    }

    for (const auto& option_id : requires_options) {
        if (!context.has_selected(option_id)) result = false;
    }

    if (result && custom_check) {
        result = custom_check(context);
    }

    return negate ? !result : result;
}

// ============================================================================
// Option / State helpers
// ============================================================================

ChoiceQuality DialogueOption::resolved_quality() const {
    if (quality != ChoiceQuality::Auto) return quality;
    if (relationship_change > 0) return ChoiceQuality::Optimal;
    if (relationship_change < 0) return ChoiceQuality::NonOptimal;
    return ChoiceQuality::Neutral;
}

const DialogueOption* DialogueState::find_option(const std::string& option_id) const {
    for (const auto& option : options) {
        if (option.id == option_id) return &option;
    }
    return nullptr;
}

uint32_t DialogueState::effective_max_visits(const core::DialogueSettings& settings) const {
    if (max_visits) return *max_visits;
    return is_backstory() ? settings.backstory_max_visits : settings.default_max_visits;
}

} // namespace narrative::dialogue
