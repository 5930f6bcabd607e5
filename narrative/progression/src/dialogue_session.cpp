#include <narrative/progression/dialogue_session.hpp>
#include <narrative/core/log.hpp>
#include <exception>
#include <map>
#include <utility>

namespace narrative::progression {

using core::log;
using core::LogLevel;

namespace {

bool reached_critical_beat(const std::map<std::string, bool>& progress) {
    for (const auto& [checkpoint, reached] : progress) {
        if (reached) return true;
    }
    return false;
}

} // namespace

DialogueSession::DialogueSession(core::EventBus& bus,
                                 ProgressionGuard& guard,
                                 std::string reward_id,
                                 economy::ResourceEconomy* economy,
                                 core::DialogueSettings settings)
    : m_guard(guard)
    , m_reward_id(std::move(reward_id))
    , m_settings(settings)
    , m_machine(bus, economy, settings) {
}

DialogueSession::~DialogueSession() {
    if (!m_machine.is_active() || m_completed) {
        return;
    }

    // Teardown safety net
    try {
        end_early("teardown", "teardown_safety_net");
    } catch (const std::exception& e) {
        log(LogLevel::Error, std::string("[DialogueSession] Teardown grant failed: ") + e.what());
    }
}

// ============================================================================
// Flow
// ============================================================================

std::string DialogueSession::start(const dialogue::DialogueGraph& graph, dialogue::DialogueContext context) {
    m_completed = false;
    m_repair_count = 0;
    return m_machine.initialize(graph, std::move(context));
}

dialogue::TransitionResult DialogueSession::select_option(const std::string& option_id) {
    try {
        return m_machine.select_option(option_id);
    } catch (const core::LoopDetectedError& e) {
        return recover(e.what());
    } catch (const core::GraphError& e) {
        return recover(e.what());
    }
}

dialogue::TransitionResult DialogueSession::advance() {
    dialogue::TransitionResult result;
    try {
        result = m_machine.advance();
    } catch (const core::LoopDetectedError& e) {
        return recover(e.what());
    } catch (const core::GraphError& e) {
        return recover(e.what());
    }

    if (!result.success && !result.terminal) {
        auto status = m_machine.get_progression_status();
        if (status.blocked) {
            return recover(status.reason);
        }
    }
    return result;
}

dialogue::TransitionResult DialogueSession::recover(const std::string& reason) {
    dialogue::TransitionResult result;
    if (!m_machine.is_active()) {
        result.message = reason;
        return result;
    }

    m_repair_count++;
    auto repair = m_machine.force_progression_repair(true, reason);

    result.success = repair.repaired;
    result.from_state_id = repair.from_state_id;
    result.to_state_id = repair.to_state_id;
    result.terminal = m_machine.is_terminal();
    result.message = "Repaired: " + repair.reason;
    return result;
}

// ============================================================================
// Exit paths
// ============================================================================

std::optional<GrantResult> DialogueSession::complete(const CompletionHandler& handler) {
    auto summary = m_machine.finalize();
    if (!summary) {
        return std::nullopt;
    }
    m_completed = true;

    RewardTier tier = determine_tier(summary->player_score, m_settings);
    bool earned = reached_critical_beat(summary->critical_path_progress);
    std::string source = "completion";

    if (handler) {
        try {
            handler(*summary);
        } catch (const std::exception& e) {
            log(LogLevel::Error, "[DialogueSession] Completion handler for '" + summary->graph_id +
                "' failed: " + e.what() + "; granting through fallback");
            source = "completion_fallback";
        }
    }

    return grant_reward(tier, source, earned, summary->graph_id);
}

std::optional<GrantResult> DialogueSession::abandon(const std::string& reason) {
    return end_early(reason, "abandon_safety_net");
}

std::optional<GrantResult> DialogueSession::end_early(const std::string& reason, const std::string& source) {
    if (!m_machine.is_active()) {
        return std::nullopt;
    }

    const dialogue::DialogueContext& context = m_machine.context();
    bool earned = reached_critical_beat(context.critical_path_progress);
    RewardTier tier = determine_tier(context.player_score, m_settings);
    std::string graph_id = m_machine.get_graph()->get_id();

    m_machine.abandon(reason);

    if (earned) {
        log(LogLevel::Warn, "[DialogueSession] Session ended (" + reason +
            ") after critical progress; granting '" + m_reward_id + "'");
    }
    return grant_reward(tier, source, earned, graph_id);
}

// Every exit path applies the same rule: the reward is earned once the
// session has reached a critical-path beat.
std::optional<GrantResult> DialogueSession::grant_reward(RewardTier tier, const std::string& source,
                                                         bool earned, const std::string& graph_id) {
    if (m_reward_id.empty()) {
        return std::nullopt;
    }
    if (!earned) {
        log(LogLevel::Info, "[DialogueSession] '" + graph_id + "' ended without a critical-path beat; '" +
            m_reward_id + "' not granted (" + source + ")");
        return std::nullopt;
    }
    return m_guard.grant(m_reward_id, tier, source);
}

} // namespace narrative::progression
