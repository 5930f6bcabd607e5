#include <narrative/dialogue/dialogue_state_machine.hpp>
#include <narrative/core/errors.hpp>
#include <narrative/core/log.hpp>
#include <cmath>
#include <deque>
#include <limits>
#include <set>
#include <type_traits>
#include <utility>

namespace narrative::dialogue {

using core::log;
using core::LogLevel;

namespace {

constexpr const char* SOURCE = "dialogue_state_machine";

} // namespace

DialogueStateMachine::DialogueStateMachine(core::EventBus& bus,
                                           economy::ResourceEconomy* economy,
                                           core::DialogueSettings settings)
    : m_bus(bus)
    , m_economy(economy)
    , m_settings(settings) {
}

// ============================================================================
// Error reporting
// ============================================================================

template<typename Error>
void DialogueStateMachine::raise(const Error& error, const std::string& detail) {
    LogLevel level = std::is_same_v<Error, core::InvalidOptionError> ? LogLevel::Warn : LogLevel::Error;
    log(level, std::string("[DialogueStateMachine] ") + error.what());

    core::ErrorEvent event;
    event.category = error.category();
    event.message = error.what();
    event.origin = SOURCE;
    event.detail = detail;
    m_bus.dispatch(event, SOURCE);

    throw error;
}

uint32_t DialogueStateMachine::max_visits(const DialogueState& state) const {
    return state.effective_max_visits(m_settings);
}

// ============================================================================
// Session Control
// ============================================================================

std::string DialogueStateMachine::initialize(const DialogueGraph& graph, DialogueContext context) {
    if (m_active) {
        log(LogLevel::Warn, "[DialogueStateMachine] Replacing active session '" + m_context.session_id + "'");
        abandon("replaced");
    }

    const DialogueState* initial = graph.get_state(graph.get_initial_state());
    if (!initial) {
        raise(core::GraphError("Dialogue graph '" + graph.get_id() + "' has no initial state '" +
                               graph.get_initial_state() + "'"), graph.get_id());
    }

    m_graph = &graph;
    m_context = std::move(context);
    if (m_context.character_id.empty()) {
        m_context.character_id = graph.get_character_id();
    }

    m_active = true;
    m_terminal = false;
    m_transition_count = 0;
    m_pending_option = nullptr;
    m_return_state_id.reset();

    core::DialogueStartedEvent started;
    started.graph_id = graph.get_id();
    started.session_id = m_context.session_id;
    started.character_id = m_context.character_id;
    started.initial_state_id = initial->id;
    m_bus.dispatch(started, SOURCE);

    // Initial visit is recorded but is not a transition
    m_current_state_id = initial->id;
    m_context.visit_counts[initial->id]++;
    m_context.visited_state_ids.insert(initial->id);
    m_context.visit_order.push_back(initial->id);
    m_terminal = initial->is_terminal();

    if (initial->is_critical_path) {
        mark_critical("state-" + initial->id, initial);
    }

    log(LogLevel::Info, "[DialogueStateMachine] Dialogue started: " + graph.get_id() +
        " (session '" + m_context.session_id + "')");
    return m_current_state_id;
}

TransitionResult DialogueStateMachine::select_option(const std::string& option_id) {
    if (!m_active) {
        raise(core::InvalidOptionError(option_id, "No active dialogue session"), option_id);
    }
    if (m_terminal) {
        raise(core::InvalidOptionError(option_id, "Dialogue '" + m_graph->get_id() + "' is complete"), option_id);
    }
    if (m_pending_option) {
        raise(core::InvalidOptionError(option_id, "Option '" + m_pending_option->id +
                                       "' is awaiting advance"), option_id);
    }

    const DialogueState* state = current_state();
    const DialogueOption* option = state->find_option(option_id);
    if (!option) {
        raise(core::InvalidOptionError(option_id, "Option '" + option_id +
                                       "' does not belong to state '" + state->id + "'"), option_id);
    }
    if (!option->is_available(m_context)) {
        raise(core::InvalidOptionError(option_id, "Option '" + option_id + "' is not available in state '" +
                                       state->id + "'"), option_id);
    }

    // Backstory checks happen before any mutation
    if (option->triggers_backstory) {
        if (is_in_backstory()) {
            raise(core::GraphError("Backstory option '" + option_id + "' selected inside backstory '" +
                                   state->id + "'"), option_id);
        }

        const DialogueState* target = m_graph->get_state(option->next_state_id);
        if (!target || !target->is_backstory()) {
            raise(core::GraphError("Backstory option '" + option_id + "' does not lead to a backstory state"),
                  option_id);
        }

        uint32_t visits = m_context.visit_count(target->id) + 1;
        uint32_t limit = max_visits(*target);
        if (visits > limit) {
            raise(core::LoopDetectedError(target->id, visits, limit), target->id);
        }
    }

    TransitionResult result;
    result.from_state_id = m_current_state_id;
    result.to_state_id = m_current_state_id;
    result.option_id = option->id;

    m_context.player_score += option->relationship_change;

    // Insight is awarded before the choice moves momentum
    if (option->insight_gain != 0) {
        int32_t awarded = 0;
        if (m_economy) {
            awarded = m_economy->award_insight(option->insight_gain, m_context.insight_multiplier, SOURCE);
        } else {
            awarded = static_cast<int32_t>(std::floor(option->insight_gain * m_context.insight_multiplier));
        }
        m_context.insight_gained += awarded;
        result.insight_awarded = awarded;
    }

    if (m_economy) {
        m_economy->record_choice(option->resolved_quality(), SOURCE);
    }

    if (option->knowledge_gain) {
        const KnowledgeGain& gain = *option->knowledge_gain;
        m_context.knowledge_gained[gain.concept_id] += gain.amount;

        core::KnowledgeGainedEvent knowledge;
        knowledge.concept_id = gain.concept_id;
        knowledge.domain_id = gain.domain_id;
        knowledge.amount = gain.amount;
        knowledge.character_id = m_context.character_id;
        knowledge.session_id = m_context.session_id;
        m_bus.dispatch(knowledge, SOURCE);
    }

    m_context.selected_option_ids.push_back(option->id);

    if (option->is_critical_path) {
        mark_critical("option-" + option->id, nullptr);
    }

    m_pending_option = option;

    core::StateOptionSelectedEvent selected;
    selected.graph_id = m_graph->get_id();
    selected.session_id = m_context.session_id;
    selected.character_id = m_context.character_id;
    selected.state_id = state->id;
    selected.option_id = option->id;
    selected.insight_gain = result.insight_awarded;
    selected.relationship_change = option->relationship_change;
    selected.player_score = m_context.player_score;
    selected.is_critical_path = option->is_critical_path;
    selected.triggers_backstory = option->triggers_backstory;
    m_bus.dispatch(selected, SOURCE);

    log(LogLevel::Debug, "[DialogueStateMachine] Selected '" + option->id + "' in '" + state->id + "'");

    result.success = true;
    result.showing_response = option->response_text.has_value();
    return result;
}

TransitionResult DialogueStateMachine::advance() {
    if (!m_active) {
        raise(core::GraphError("advance() called without an active dialogue session"), "");
    }

    TransitionResult result;
    result.from_state_id = m_current_state_id;
    result.to_state_id = m_current_state_id;

    if (m_terminal) {
        result.terminal = true;
        result.message = "Dialogue is complete";
        return result;
    }

    const DialogueState* state = current_state();
    std::string target_id;
    bool entering_backstory = false;
    bool returning = false;

    if (m_pending_option && m_pending_option->triggers_backstory) {
        target_id = m_pending_option->next_state_id;
        entering_backstory = true;
    } else if (m_return_state_id) {
        target_id = *m_return_state_id;
        returning = true;
    } else if (m_pending_option && !m_pending_option->next_state_id.empty()) {
        target_id = m_pending_option->next_state_id;
    } else if (!m_pending_option && !available_options().empty()) {
        result.message = "Awaiting option selection";
        return result;
    } else {
        target_id = resolve_continuation(*state);
    }

    if (target_id.empty()) {
        if (state->is_conclusion) {
            // Closing choice on a conclusion
            m_pending_option = nullptr;
            m_terminal = true;
            emit_state_changed(state->id, *state, false, false, false);

            result.success = true;
            result.terminal = true;
            return result;
        }

        result.message = "No transition available from '" + state->id + "'";
        log(LogLevel::Warn, "[DialogueStateMachine] " + result.message);
        return result;
    }

    if (m_transition_count >= m_settings.max_transitions) {
        raise(core::LoopDetectedError(m_current_state_id, m_transition_count, m_settings.max_transitions),
              m_current_state_id);
    }

    const DialogueState* target = m_graph->get_state(target_id);
    if (!target) {
        raise(core::GraphError("State '" + state->id + "' resolved to unknown state '" + target_id + "'"),
              target_id);
    }

    if (!returning) {
        uint32_t visits = m_context.visit_count(target->id) + 1;
        uint32_t limit = max_visits(*target);
        if (visits > limit) {
            raise(core::LoopDetectedError(target->id, visits, limit), target->id);
        }
    }

    std::string from = m_current_state_id;
    m_pending_option = nullptr;
    if (entering_backstory) {
        m_return_state_id = from;
    } else if (returning) {
        m_return_state_id.reset();
    }

    enter_state(*target, !returning);
    emit_state_changed(from, *target, entering_backstory, returning, false);

    if (target->is_critical_path && !returning) {
        mark_critical("state-" + target->id, target);
    }

    result.success = true;
    result.to_state_id = target->id;
    result.terminal = m_terminal;
    result.entered_backstory = entering_backstory;
    result.returned_from_backstory = returning;
    return result;
}

std::optional<SessionSummary> DialogueStateMachine::finalize() {
    if (!m_active) {
        return std::nullopt;
    }
    if (!m_terminal) {
        log(LogLevel::Warn, "[DialogueStateMachine] finalize() before '" + m_graph->get_id() +
            "' reached a conclusion");
        return std::nullopt;
    }

    SessionSummary summary;
    summary.graph_id = m_graph->get_id();
    summary.session_id = m_context.session_id;
    summary.character_id = m_context.character_id;
    summary.final_state_id = m_current_state_id;
    summary.player_score = m_context.player_score;
    summary.insight_gained = m_context.insight_gained;
    summary.selected_option_ids = m_context.selected_option_ids;
    summary.visit_order = m_context.visit_order;
    summary.knowledge_gained = m_context.knowledge_gained;
    summary.critical_path_progress = m_context.critical_path_progress;
    summary.critical_paths_completed = missing_states(false).empty();

    core::DialogueCompletedEvent completed;
    completed.graph_id = summary.graph_id;
    completed.session_id = summary.session_id;
    completed.character_id = summary.character_id;
    completed.final_state_id = summary.final_state_id;
    completed.player_score = summary.player_score;
    completed.insight_gained = summary.insight_gained;
    completed.selected_option_ids = summary.selected_option_ids;
    completed.knowledge_gained = summary.knowledge_gained;
    completed.critical_paths_completed = summary.critical_paths_completed;
    m_bus.dispatch(completed, SOURCE);

    log(LogLevel::Info, "[DialogueStateMachine] Dialogue completed: " + summary.graph_id +
        " at '" + summary.final_state_id + "' (score " + std::to_string(summary.player_score) + ")");

    reset_session();
    return summary;
}

void DialogueStateMachine::abandon(const std::string& reason) {
    if (!m_active) return;

    core::DialogueAbandonedEvent abandoned;
    abandoned.graph_id = m_graph->get_id();
    abandoned.session_id = m_context.session_id;
    abandoned.character_id = m_context.character_id;
    abandoned.state_id = m_current_state_id;
    abandoned.reason = reason;
    m_bus.dispatch(abandoned, SOURCE);

    log(LogLevel::Info, "[DialogueStateMachine] Dialogue abandoned: " + m_graph->get_id() + " (" + reason + ")");
    reset_session();
}

void DialogueStateMachine::reset_session() {
    m_active = false;
    m_terminal = false;
    m_graph = nullptr;
    m_context = DialogueContext{};
    m_current_state_id.clear();
    m_transition_count = 0;
    m_pending_option = nullptr;
    m_return_state_id.reset();
}

// ============================================================================
// Transitions
// ============================================================================

std::string DialogueStateMachine::resolve_continuation(const DialogueState& state) const {
    for (const auto& branch : state.conditional_next) {
        if (branch.condition.evaluate(m_context)) {
            return branch.state_id;
        }
    }
    return state.next_state_id;
}

void DialogueStateMachine::enter_state(const DialogueState& target, bool count_visit) {
    m_current_state_id = target.id;
    m_transition_count++;

    if (count_visit) {
        m_context.visit_counts[target.id]++;
        m_context.visited_state_ids.insert(target.id);
        m_context.visit_order.push_back(target.id);
    }

    if (target.is_terminal()) {
        m_terminal = true;
    }
}

void DialogueStateMachine::mark_critical(const std::string& checkpoint, const DialogueState* state) {
    bool& reached = m_context.critical_path_progress[checkpoint];
    if (reached) return;
    reached = true;

    if (!state) return;

    core::CriticalPathReachedEvent event;
    event.graph_id = m_graph->get_id();
    event.session_id = m_context.session_id;
    event.character_id = m_context.character_id;
    event.state_id = state->id;
    event.player_score = m_context.player_score;
    m_bus.dispatch(event, SOURCE);
}

void DialogueStateMachine::emit_state_changed(const std::string& from, const DialogueState& to,
                                              bool entered_backstory, bool returned, bool synthetic) {
    core::StateChangedEvent event;
    event.graph_id = m_graph->get_id();
    event.session_id = m_context.session_id;
    event.from_state_id = from;
    event.to_state_id = to.id;
    event.visit_count = m_context.visit_count(to.id);
    event.terminal = m_terminal;
    event.entered_backstory = entered_backstory;
    event.returned_from_backstory = returned;
    event.synthetic = synthetic;
    m_bus.dispatch(event, SOURCE);
}

// ============================================================================
// Progression
// ============================================================================

std::vector<std::string> DialogueStateMachine::missing_states(bool mandatory) const {
    std::vector<std::string> result;
    if (!m_graph) return result;

    for (const auto& state : m_graph->get_states()) {
        bool relevant = mandatory ? state.is_mandatory : state.is_critical_path;
        if (relevant && !m_context.has_visited(state.id)) {
            result.push_back(state.id);
        }
    }
    return result;
}

bool DialogueStateMachine::is_blocked_here(std::string& reason) const {
    if (m_pending_option || m_return_state_id) {
        return false;
    }

    const DialogueState* state = current_state();
    if (state->is_conclusion || !available_options().empty()) {
        return false;
    }

    std::string next = resolve_continuation(*state);
    if (next.empty()) {
        reason = "State '" + state->id + "' has no available options and no next state";
        return true;
    }

    const DialogueState* target = m_graph->get_state(next);
    if (!target) {
        reason = "State '" + state->id + "' leads to unknown state '" + next + "'";
        return true;
    }

    if (m_context.visit_count(target->id) >= max_visits(*target)) {
        reason = "Next state '" + target->id + "' has exhausted its visits";
        return true;
    }

    return false;
}

ProgressionStatus DialogueStateMachine::get_progression_status() const {
    ProgressionStatus status;
    if (!m_active) {
        status.reason = "No active dialogue session";
        return status;
    }

    status.missing_mandatory = missing_states(true);
    status.missing_critical = missing_states(false);
    status.critical_paths_completed = status.missing_critical.empty();

    if (m_terminal) {
        return status;
    }

    if (is_blocked_here(status.reason)) {
        status.blocked = true;
        return status;
    }

    if (status.missing_mandatory.empty()) {
        return status;
    }

    // States still enterable from here given the remaining visit budgets
    std::set<std::string> reachable;
    std::deque<std::string> frontier;
    auto push = [&](const std::string& id) {
        if (id.empty() || reachable.count(id)) return;
        reachable.insert(id);
        frontier.push_back(id);
    };

    push(m_current_state_id);
    if (m_return_state_id) push(*m_return_state_id);
    if (m_pending_option) push(m_pending_option->next_state_id);

    while (!frontier.empty()) {
        const DialogueState* state = m_graph->get_state(frontier.front());
        frontier.pop_front();
        if (!state) continue;

        for (const auto& next : m_graph->main_successors(*state)) {
            const DialogueState* target = m_graph->get_state(next);
            if (target && m_context.visit_count(next) < max_visits(*target)) {
                push(next);
            }
        }
    }

    for (const auto& id : status.missing_mandatory) {
        if (!reachable.count(id)) {
            status.blocked = true;
            status.reason = "Mandatory state '" + id + "' is unreachable from '" + m_current_state_id + "'";
            break;
        }
    }

    return status;
}

RepairResult DialogueStateMachine::force_progression_repair(bool force, const std::string& reason) {
    RepairResult result;
    if (!m_active) {
        result.reason = "No active dialogue session";
        return result;
    }

    ProgressionStatus status = get_progression_status();
    if (!status.blocked && !force) {
        result.reason = "Progression is not blocked";
        return result;
    }

    result.from_state_id = m_current_state_id;
    result.reason = !reason.empty() ? reason : (status.blocked ? status.reason : "Forced repair");

    // Nearest by main-path distance from here, then declaration order
    auto distances = m_graph->main_path_distances(m_current_state_id);
    auto rank = [&](const DialogueState& state) {
        auto it = distances.find(state.id);
        size_t distance = it != distances.end() ? it->second : std::numeric_limits<size_t>::max();
        return std::make_pair(distance, m_graph->index_of(state.id));
    };

    auto has_budget = [&](const DialogueState& state) {
        return m_context.visit_count(state.id) < max_visits(state);
    };

    const DialogueState* target = nullptr;
    for (const auto& state : m_graph->get_states()) {
        if (state.id == m_current_state_id || m_context.has_visited(state.id)) continue;
        if (!state.is_critical_path && !state.is_mandatory) continue;
        if (!has_budget(state)) continue;
        if (!target || rank(state) < rank(*target)) target = &state;
    }

    if (!target) {
        for (const auto& state : m_graph->get_states()) {
            if (state.id == m_current_state_id || !state.is_conclusion) continue;
            if (!has_budget(state)) continue;
            if (!target || rank(state) < rank(*target)) target = &state;
        }
    }

    m_pending_option = nullptr;
    m_return_state_id.reset();

    core::ProgressionRepairEvent repair;
    repair.graph_id = m_graph->get_id();
    repair.session_id = m_context.session_id;
    repair.character_id = m_context.character_id;
    repair.from_state_id = result.from_state_id;
    repair.reason = result.reason;

    if (!target) {
        // Nothing left to jump to: end the session where it stands
        m_terminal = true;
        result.repaired = true;
        result.terminated = true;
        result.to_state_id = m_current_state_id;

        log(LogLevel::Warn, "[DialogueStateMachine] Forced repair ended session at '" +
            m_current_state_id + "': " + result.reason);

        repair.to_state_id = m_current_state_id;
        m_bus.dispatch(repair, SOURCE);
        emit_state_changed(result.from_state_id, *current_state(), false, false, true);
        return result;
    }

    log(LogLevel::Warn, "[DialogueStateMachine] Forced repair '" + result.from_state_id + "' -> '" +
        target->id + "': " + result.reason);

    repair.to_state_id = target->id;
    m_bus.dispatch(repair, SOURCE);

    enter_state(*target, true);
    emit_state_changed(result.from_state_id, *target, false, false, true);

    if (target->is_critical_path) {
        mark_critical("state-" + target->id, target);
    }

    result.repaired = true;
    result.to_state_id = target->id;
    return result;
}

// ============================================================================
// State Getters
// ============================================================================

const DialogueState* DialogueStateMachine::current_state() const {
    if (!m_graph) return nullptr;
    return m_graph->get_state(m_current_state_id);
}

bool DialogueStateMachine::is_showing_response() const {
    return m_pending_option && m_pending_option->response_text.has_value();
}

bool DialogueStateMachine::is_in_critical_state() const {
    const DialogueState* state = current_state();
    return state && state->is_critical_path;
}

std::string DialogueStateMachine::current_text() const {
    if (is_showing_response()) {
        return *m_pending_option->response_text;
    }
    const DialogueState* state = current_state();
    return state ? state->text : std::string{};
}

std::vector<const DialogueOption*> DialogueStateMachine::available_options() const {
    std::vector<const DialogueOption*> result;
    if (!m_active || m_terminal || m_pending_option) return result;

    const DialogueState* state = current_state();
    if (!state) return result;

    for (const auto& option : state->options) {
        if (option.is_available(m_context)) {
            result.push_back(&option);
        }
    }
    return result;
}

} // namespace narrative::dialogue
