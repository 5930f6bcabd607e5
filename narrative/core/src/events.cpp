#include <narrative/core/events.hpp>
#include <type_traits>

namespace narrative::core {

const char* to_string(EventType type) {
    switch (type) {
        case EventType::DialogueStarted:     return "DIALOGUE_STARTED";
        case EventType::StateOptionSelected: return "STATE_OPTION_SELECTED";
        case EventType::StateChanged:        return "STATE_CHANGED";
        case EventType::CriticalPathReached: return "CRITICAL_PATH_REACHED";
        case EventType::ProgressionRepair:   return "PROGRESSION_REPAIR";
        case EventType::DialogueCompleted:   return "DIALOGUE_COMPLETED";
        case EventType::DialogueAbandoned:   return "DIALOGUE_ABANDONED";
        case EventType::KnowledgeGained:     return "KNOWLEDGE_GAINED";
        case EventType::ResourceChanged:     return "RESOURCE_CHANGED";
        case EventType::MomentumReset:       return "MOMENTUM_RESET";
        case EventType::ThresholdCrossed:    return "THRESHOLD_CROSSED";
        case EventType::StrategicAction:     return "STRATEGIC_ACTION";
        case EventType::RewardGranted:       return "REWARD_GRANTED";
        case EventType::Error:               return "ERROR";
        case EventType::Count:               break;
    }
    return "UNKNOWN";
}

EventType type_of(const EventPayload& payload) {
    return std::visit([](const auto& p) {
        return std::decay_t<decltype(p)>::type;
    }, payload);
}

} // namespace narrative::core
