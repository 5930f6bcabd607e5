#pragma once

#include <narrative/progression/progression_guard.hpp>
#include <narrative/dialogue/dialogue_state_machine.hpp>
#include <narrative/dialogue/view_state.hpp>
#include <functional>
#include <optional>
#include <string>

namespace narrative::progression {

// ============================================================================
// DialogueSession - owner of one running dialogue
//
// Wraps the state machine for a UI surface and issues the session's reward
// from whichever exit path runs first: normal completion, the fallback when
// the completion handler throws, abandonment, or teardown. The reward is
// earned once a critical-path beat is reached, whichever path observes it.
// Every path goes through the ProgressionGuard, so running several of them
// is harmless.
// ============================================================================

class DialogueSession {
public:
    using CompletionHandler = std::function<void(const dialogue::SessionSummary&)>;

    // An empty `reward_id` disables reward grants
    DialogueSession(core::EventBus& bus,
                    ProgressionGuard& guard,
                    std::string reward_id,
                    economy::ResourceEconomy* economy = nullptr,
                    core::DialogueSettings settings = {});
    ~DialogueSession();

    DialogueSession(const DialogueSession&) = delete;
    DialogueSession& operator=(const DialogueSession&) = delete;

    // ========================================================================
    // Flow
    // ========================================================================

    std::string start(const dialogue::DialogueGraph& graph, dialogue::DialogueContext context);

    // InvalidOptionError propagates (re-prompt). Loop and graph errors fall
    // back to forced repair.
    dialogue::TransitionResult select_option(const std::string& option_id);

    // Loop and graph errors, and a blocked session, fall back to forced repair
    dialogue::TransitionResult advance();

    dialogue::ViewState view() const { return dialogue::make_view_state(m_machine); }

    // ========================================================================
    // Exit paths
    // ========================================================================

    // Finalizes a terminal session, runs `handler` and grants the reward if
    // it was earned. Returns nullopt when the session is not terminal or
    // nothing was granted.
    std::optional<GrantResult> complete(const CompletionHandler& handler = nullptr);

    // Ends the session early; grants when critical progress was made
    std::optional<GrantResult> abandon(const std::string& reason = "abandoned");

    // ========================================================================
    // State
    // ========================================================================

    bool is_active() const { return m_machine.is_active(); }
    bool is_completed() const { return m_completed; }
    uint32_t repair_count() const { return m_repair_count; }

    const dialogue::DialogueStateMachine& machine() const { return m_machine; }
    const std::string& reward_id() const { return m_reward_id; }

private:
    dialogue::TransitionResult recover(const std::string& reason);
    std::optional<GrantResult> end_early(const std::string& reason, const std::string& source);
    std::optional<GrantResult> grant_reward(RewardTier tier, const std::string& source,
                                            bool earned, const std::string& graph_id);

    ProgressionGuard& m_guard;
    std::string m_reward_id;
    core::DialogueSettings m_settings;
    dialogue::DialogueStateMachine m_machine;

    bool m_completed = false;
    uint32_t m_repair_count = 0;
};

} // namespace narrative::progression
