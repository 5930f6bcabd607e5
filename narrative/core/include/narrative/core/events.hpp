#pragma once

#include <cstdint>
#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace narrative::core {

// ============================================================================
// EventType - closed set of bus channels
// ============================================================================

enum class EventType : uint8_t {
    DialogueStarted = 0,
    StateOptionSelected,
    StateChanged,
    CriticalPathReached,
    ProgressionRepair,
    DialogueCompleted,
    DialogueAbandoned,
    KnowledgeGained,
    ResourceChanged,
    MomentumReset,
    ThresholdCrossed,
    StrategicAction,
    RewardGranted,
    Error,

    Count
};

constexpr size_t EVENT_TYPE_COUNT = static_cast<size_t>(EventType::Count);

const char* to_string(EventType type);

// ============================================================================
// Payloads
//
// Each payload is the versioned contract for its channel. Adding optional
// fields is safe; removing or renaming fields breaks consumers.
// ============================================================================

struct DialogueStartedEvent {
    static constexpr EventType type = EventType::DialogueStarted;

    std::string graph_id;
    std::string session_id;
    std::string character_id;
    std::string initial_state_id;
};

struct StateOptionSelectedEvent {
    static constexpr EventType type = EventType::StateOptionSelected;

    std::string graph_id;
    std::string session_id;
    std::string character_id;
    std::string state_id;
    std::string option_id;
    int32_t insight_gain = 0;
    int32_t relationship_change = 0;
    int32_t player_score = 0;           // Score after the option was applied
    bool is_critical_path = false;
    bool triggers_backstory = false;
};

struct StateChangedEvent {
    static constexpr EventType type = EventType::StateChanged;

    std::string graph_id;
    std::string session_id;
    std::string from_state_id;
    std::string to_state_id;
    uint32_t visit_count = 0;
    bool terminal = false;
    bool entered_backstory = false;
    bool returned_from_backstory = false;
    bool synthetic = false;             // Produced by forced repair, not by a choice
};

struct CriticalPathReachedEvent {
    static constexpr EventType type = EventType::CriticalPathReached;

    std::string graph_id;
    std::string session_id;
    std::string character_id;
    std::string state_id;
    int32_t player_score = 0;
};

struct ProgressionRepairEvent {
    static constexpr EventType type = EventType::ProgressionRepair;

    std::string graph_id;
    std::string session_id;
    std::string character_id;
    std::string from_state_id;
    std::string to_state_id;
    std::string reason;
};

struct DialogueCompletedEvent {
    static constexpr EventType type = EventType::DialogueCompleted;

    std::string graph_id;
    std::string session_id;
    std::string character_id;
    std::string final_state_id;
    int32_t player_score = 0;
    int32_t insight_gained = 0;
    std::vector<std::string> selected_option_ids;
    std::map<std::string, int32_t> knowledge_gained;
    bool critical_paths_completed = false;
};

struct DialogueAbandonedEvent {
    static constexpr EventType type = EventType::DialogueAbandoned;

    std::string graph_id;
    std::string session_id;
    std::string character_id;
    std::string state_id;
    std::string reason;
};

struct KnowledgeGainedEvent {
    static constexpr EventType type = EventType::KnowledgeGained;

    std::string concept_id;
    std::string domain_id;
    int32_t amount = 0;
    std::string character_id;
    std::string session_id;
};

struct ResourceChangedEvent {
    static constexpr EventType type = EventType::ResourceChanged;

    std::string resource_id;
    int32_t previous_value = 0;
    int32_t new_value = 0;
    int32_t delta = 0;                  // new_value - previous_value
    int32_t min_value = 0;
    int32_t max_value = 0;
    std::string source;
};

struct MomentumResetEvent {
    static constexpr EventType type = EventType::MomentumReset;

    int32_t previous_value = 0;
    int32_t new_value = 0;
    uint32_t streak_lost = 0;           // Consecutive favorable choices discarded
    std::string source;
};

enum class CrossingDirection : uint8_t {
    Up,
    Down
};

struct ThresholdCrossedEvent {
    static constexpr EventType type = EventType::ThresholdCrossed;

    std::string resource_id;
    std::string label;
    int32_t threshold = 0;
    int32_t value = 0;
    CrossingDirection direction = CrossingDirection::Up;
};

struct StrategicActionEvent {
    static constexpr EventType type = EventType::StrategicAction;

    std::string action;                 // "reframe", "extrapolate", "synthesis", "boast"
    std::string phase;                  // "activated", "completed", "cancelled"
    int32_t insight_cost = 0;
    int32_t insight_refunded = 0;
    bool successful = true;
    std::string character_id;
};

struct RewardGrantedEvent {
    static constexpr EventType type = EventType::RewardGranted;

    std::string save_id;
    std::string reward_id;
    std::string tier;
    std::string previous_tier;          // Empty on first grant
    bool upgrade = false;
    std::string source;                 // Call site that issued the grant
};

struct ErrorEvent {
    static constexpr EventType type = EventType::Error;

    std::string category;               // "graph_error", "loop_detected", "handler_failure", ...
    std::string message;
    std::string origin;                 // Component that raised it
    std::string detail;                 // State id, reward id, event type...
};

// ============================================================================
// Event - immutable record handed to every handler
// ============================================================================

using EventPayload = std::variant<
    DialogueStartedEvent,
    StateOptionSelectedEvent,
    StateChangedEvent,
    CriticalPathReachedEvent,
    ProgressionRepairEvent,
    DialogueCompletedEvent,
    DialogueAbandonedEvent,
    KnowledgeGainedEvent,
    ResourceChangedEvent,
    MomentumResetEvent,
    ThresholdCrossedEvent,
    StrategicActionEvent,
    RewardGrantedEvent,
    ErrorEvent
>;

static_assert(std::variant_size_v<EventPayload> == EVENT_TYPE_COUNT,
              "Every EventType needs exactly one payload alternative");

struct Event {
    EventType type = EventType::Error;
    EventPayload payload;
    uint64_t timestamp = 0;             // Milliseconds since epoch
    std::string source;
    uint64_t sequence = 0;              // Monotonic per bus

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&payload); }
};

EventType type_of(const EventPayload& payload);

} // namespace narrative::core
