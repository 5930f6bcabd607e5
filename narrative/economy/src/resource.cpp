#include <narrative/economy/resource.hpp>
#include <narrative/economy/strategic_action.hpp>

namespace narrative::economy {

const char* to_string(ChoiceQuality quality) {
    switch (quality) {
        case ChoiceQuality::Auto:       return "auto";
        case ChoiceQuality::Optimal:    return "optimal";
        case ChoiceQuality::Neutral:    return "neutral";
        case ChoiceQuality::NonOptimal: return "non_optimal";
    }
    return "auto";
}

ChoiceQuality choice_quality_from_string(const std::string& str) {
    if (str == "optimal") return ChoiceQuality::Optimal;
    if (str == "neutral") return ChoiceQuality::Neutral;
    if (str == "non_optimal" || str == "nonoptimal") return ChoiceQuality::NonOptimal;
    return ChoiceQuality::Auto;
}

const char* to_string(StrategicAction action) {
    switch (action) {
        case StrategicAction::Reframe:     return "reframe";
        case StrategicAction::Extrapolate: return "extrapolate";
        case StrategicAction::Synthesis:   return "synthesis";
        case StrategicAction::Boast:       return "boast";
    }
    return "unknown";
}

std::optional<StrategicAction> strategic_action_from_string(const std::string& str) {
    for (StrategicAction action : ALL_STRATEGIC_ACTIONS) {
        if (str == to_string(action)) return action;
    }
    return std::nullopt;
}

} // namespace narrative::economy
