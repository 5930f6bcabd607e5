#pragma once

#include <narrative/dialogue/dialogue_graph.hpp>
#include <narrative/dialogue/dialogue_context.hpp>
#include <narrative/core/event_bus.hpp>
#include <narrative/core/settings.hpp>
#include <narrative/economy/resource_economy.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace narrative::dialogue {

// ============================================================================
// Results
// ============================================================================

struct TransitionResult {
    bool success = false;
    std::string from_state_id;
    std::string to_state_id;
    std::string option_id;              // Set by select_option
    bool terminal = false;
    bool entered_backstory = false;
    bool returned_from_backstory = false;
    bool showing_response = false;
    int32_t insight_awarded = 0;
    std::string message;                // Why nothing happened, when success is false
};

struct ProgressionStatus {
    bool blocked = false;
    std::string reason;
    std::vector<std::string> missing_mandatory;     // Unvisited mandatory states
    std::vector<std::string> missing_critical;      // Unvisited critical-path states
    bool critical_paths_completed = false;
};

struct RepairResult {
    bool repaired = false;
    std::string from_state_id;
    std::string to_state_id;
    std::string reason;
    bool terminated = false;            // No target left; session ended in place
};

struct SessionSummary {
    std::string graph_id;
    std::string session_id;
    std::string character_id;
    std::string final_state_id;
    int32_t player_score = 0;
    int32_t insight_gained = 0;
    std::vector<std::string> selected_option_ids;
    std::vector<std::string> visit_order;
    std::map<std::string, int32_t> knowledge_gained;
    std::map<std::string, bool> critical_path_progress;
    bool critical_paths_completed = false;
};

// ============================================================================
// Dialogue State Machine
//
// Walks a validated graph for one session. Context is mutated only through
// select_option/advance (and force_progression_repair as the escape hatch).
// Every raised error is dispatched as an ErrorEvent first.
// ============================================================================

class DialogueStateMachine {
public:
    // `economy` is optional; without it insight is tracked in the context only
    DialogueStateMachine(core::EventBus& bus,
                         economy::ResourceEconomy* economy = nullptr,
                         core::DialogueSettings settings = {});

    DialogueStateMachine(const DialogueStateMachine&) = delete;
    DialogueStateMachine& operator=(const DialogueStateMachine&) = delete;

    // ========================================================================
    // Session Control
    // ========================================================================

    // Starts a session at the graph's initial state. The graph must outlive
    // the session. Throws GraphError when the initial state is missing.
    std::string initialize(const DialogueGraph& graph, DialogueContext context);

    // Applies the option's effects. Throws InvalidOptionError when the option
    // is not selectable, LoopDetectedError when a backstory target is out of
    // visits, GraphError on nested backstory.
    TransitionResult select_option(const std::string& option_id);

    // Moves to the resolved next state. Throws LoopDetectedError instead of
    // exceeding a visit budget or the transition cap.
    TransitionResult advance();

    // Reads the final context and ends the session. Only valid once terminal.
    std::optional<SessionSummary> finalize();

    // Ends the session without completion
    void abandon(const std::string& reason = "abandoned");

    // ========================================================================
    // Progression
    // ========================================================================

    ProgressionStatus get_progression_status() const;

    // Jumps to the nearest unvisited critical-path (or mandatory) state, else
    // to a conclusion. No-op unless blocked or `force` is set.
    RepairResult force_progression_repair(bool force = false, const std::string& reason = {});

    // ========================================================================
    // State Getters
    // ========================================================================

    bool is_active() const { return m_active; }
    bool is_terminal() const { return m_terminal; }
    bool is_in_backstory() const { return m_return_state_id.has_value(); }
    bool is_showing_response() const;
    bool has_pending_option() const { return m_pending_option != nullptr; }
    bool is_in_critical_state() const;

    const DialogueGraph* get_graph() const { return m_graph; }
    const DialogueState* current_state() const;
    const std::string& current_state_id() const { return m_current_state_id; }
    std::string current_text() const;

    // Options whose condition holds; empty while a selection awaits advance
    std::vector<const DialogueOption*> available_options() const;

    const DialogueContext& context() const { return m_context; }
    uint32_t transition_count() const { return m_transition_count; }
    const core::DialogueSettings& settings() const { return m_settings; }

private:
    template<typename Error>
    [[noreturn]] void raise(const Error& error, const std::string& detail);

    uint32_t max_visits(const DialogueState& state) const;

    std::string resolve_continuation(const DialogueState& state) const;
    bool is_blocked_here(std::string& reason) const;

    // Commits a move; `count_visit` is false when returning from backstory
    void enter_state(const DialogueState& target, bool count_visit);

    // Marks a checkpoint once; reaching a state also emits CriticalPathReached
    void mark_critical(const std::string& checkpoint, const DialogueState* state);
    void emit_state_changed(const std::string& from, const DialogueState& to,
                            bool entered_backstory, bool returned, bool synthetic);

    std::vector<std::string> missing_states(bool mandatory) const;
    void reset_session();

    core::EventBus& m_bus;
    economy::ResourceEconomy* m_economy;
    core::DialogueSettings m_settings;

    const DialogueGraph* m_graph = nullptr;
    DialogueContext m_context;
    std::string m_current_state_id;

    bool m_active = false;
    bool m_terminal = false;
    uint32_t m_transition_count = 0;

    const DialogueOption* m_pending_option = nullptr;
    std::optional<std::string> m_return_state_id;   // One-level backstory return stack
};

} // namespace narrative::dialogue
