#include <narrative/dialogue/dialogue_graph.hpp>
#include <narrative/dialogue/dialogue_loader.hpp>
#include <narrative/core/log.hpp>
#include <deque>
#include <set>

namespace narrative::dialogue {

using core::log;
using core::LogLevel;

// ============================================================================
// Dialogue Graph Implementation
// ============================================================================

DialogueGraph::DialogueGraph(const std::string& id)
    : m_id(id) {
}

void DialogueGraph::add_state(DialogueState state) {
    if (m_state_index.count(state.id)) {
        m_duplicate_ids.push_back(state.id);
        return;
    }

    std::string id = state.id;
    m_state_index[id] = m_states.size();
    m_states.push_back(std::move(state));
}

const DialogueState* DialogueGraph::get_state(const std::string& id) const {
    auto it = m_state_index.find(id);
    if (it == m_state_index.end()) return nullptr;
    return &m_states[it->second];
}

bool DialogueGraph::has_state(const std::string& id) const {
    return m_state_index.count(id) > 0;
}

size_t DialogueGraph::index_of(const std::string& id) const {
    auto it = m_state_index.find(id);
    return it != m_state_index.end() ? it->second : m_states.size();
}

std::vector<std::string> DialogueGraph::main_successors(const DialogueState& state) const {
    std::vector<std::string> result;

    for (const auto& branch : state.conditional_next) {
        result.push_back(branch.state_id);
    }
    if (!state.next_state_id.empty()) {
        result.push_back(state.next_state_id);
    }
    for (const auto& option : state.options) {
        if (!option.triggers_backstory && !option.next_state_id.empty()) {
            result.push_back(option.next_state_id);
        }
    }
    return result;
}

std::vector<std::string> DialogueGraph::backstory_successors(const DialogueState& state) const {
    std::vector<std::string> result;
    for (const auto& option : state.options) {
        if (option.triggers_backstory && !option.next_state_id.empty()) {
            result.push_back(option.next_state_id);
        }
    }
    return result;
}

std::unordered_map<std::string, size_t> DialogueGraph::main_path_distances(const std::string& from,
                                                                           const std::string& skip) const {
    std::unordered_map<std::string, size_t> distances;
    if (from == skip || !has_state(from)) {
        return distances;
    }

    std::deque<std::string> frontier;
    distances[from] = 0;
    frontier.push_back(from);

    while (!frontier.empty()) {
        std::string id = frontier.front();
        frontier.pop_front();

        const DialogueState* state = get_state(id);
        if (!state) continue;

        for (const auto& next : main_successors(*state)) {
            if (next == skip || distances.count(next) || !has_state(next)) continue;
            distances[next] = distances[id] + 1;
            frontier.push_back(next);
        }
    }

    return distances;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

void validate_references(const DialogueGraph& graph, const DialogueState& state,
                         ValidationResult& result) {
    if (!state.next_state_id.empty() && !graph.has_state(state.next_state_id)) {
        result.add_error("State '" + state.id + "' references unknown next state '" +
                         state.next_state_id + "'");
    }

    for (const auto& branch : state.conditional_next) {
        if (!graph.has_state(branch.state_id)) {
            result.add_error("State '" + state.id + "' has a conditional branch to unknown state '" +
                             branch.state_id + "'");
        }
    }

    std::set<std::string> option_ids;
    for (const auto& option : state.options) {
        if (!option_ids.insert(option.id).second) {
            result.add_error("State '" + state.id + "' declares option '" + option.id + "' twice");
        }

        if (option.next_state_id.empty()) {
            if (option.triggers_backstory) {
                result.add_error("Backstory option '" + option.id + "' in state '" + state.id +
                                 "' has no target");
            } else if (!state.has_continuation() && !state.is_conclusion && !state.is_backstory()) {
                result.add_error("Option '" + option.id + "' in state '" + state.id + "' leads nowhere");
            }
        } else if (const DialogueState* target = graph.get_state(option.next_state_id)) {
            if (option.triggers_backstory && !target->is_backstory()) {
                result.add_error("Option '" + option.id + "' in state '" + state.id +
                                 "' triggers backstory but '" + target->id + "' is not a backstory state");
            }
        } else {
            result.add_error("Option '" + option.id + "' in state '" + state.id +
                             "' references unknown target '" + option.next_state_id + "'");
        }

        if (option.triggers_backstory && state.is_backstory()) {
            result.add_error("Backstory state '" + state.id + "' nests further backstory through option '" +
                             option.id + "'");
        }
    }

    if (!state.is_conclusion && !state.is_backstory() && !state.has_options() && !state.has_continuation()) {
        result.add_error("State '" + state.id + "' is a dead end (no options, no next, not a conclusion)");
    }
}

bool reaches_conclusion(const DialogueGraph& graph,
                        const std::unordered_map<std::string, size_t>& distances) {
    for (const auto& [id, distance] : distances) {
        const DialogueState* state = graph.get_state(id);
        if (state && state->is_conclusion) return true;
    }
    return false;
}

} // namespace

ValidationResult validate_graph(const DialogueGraph& graph) {
    ValidationResult result;

    const std::string& initial = graph.get_initial_state();
    bool has_initial = false;

    if (initial.empty()) {
        result.add_error("No initial state defined");
    } else if (!graph.has_state(initial)) {
        result.add_error("Initial state '" + initial + "' not found");
    } else {
        has_initial = true;
    }

    for (const auto& id : graph.get_duplicate_ids()) {
        result.add_error("Duplicate state id '" + id + "'");
    }

    for (const auto& state : graph.get_states()) {
        validate_references(graph, state, result);
    }

    if (!has_initial) {
        return result;
    }

    // Reachability: main path plus backstory side content hanging off it
    auto main = graph.main_path_distances(initial);

    std::set<std::string> side_content;
    for (const auto& [id, distance] : main) {
        for (const auto& target : graph.backstory_successors(*graph.get_state(id))) {
            if (!main.count(target) && graph.has_state(target)) {
                side_content.insert(target);
            }
        }
    }

    for (const auto& state : graph.get_states()) {
        if (!main.count(state.id) && !side_content.count(state.id)) {
            result.add_error("State '" + state.id + "' is unreachable from '" + initial + "'");
        }
    }

    for (const auto& id : side_content) {
        if (graph.get_state(id)->is_critical_path) {
            result.add_warning("Critical-path state '" + id + "' is only reachable as optional backstory");
        }
    }

    if (!reaches_conclusion(graph, main)) {
        result.add_warning("No conclusion is reachable from '" + initial + "'");
    }

    // Mandatory states must lie on every path to a conclusion
    for (const auto& state : graph.get_states()) {
        if (!state.is_mandatory) continue;

        if (side_content.count(state.id)) {
            result.add_error("Mandatory state '" + state.id + "' is optional backstory and can be skipped");
            continue;
        }
        if (!main.count(state.id) || state.id == initial) {
            continue;  // Unreachable already reported
        }

        auto without = graph.main_path_distances(initial, state.id);
        if (reaches_conclusion(graph, without)) {
            result.add_error("Mandatory state '" + state.id + "' can be bypassed on the way to a conclusion");
        }
    }

    // Cycles that never lead out rely on the loop guard and repair
    for (const auto& [id, distance] : main) {
        const DialogueState* state = graph.get_state(id);
        if (state->is_conclusion) continue;
        if (!reaches_conclusion(graph, graph.main_path_distances(id))) {
            result.add_warning("State '" + id + "' cannot reach a conclusion");
        }
    }

    return result;
}

// ============================================================================
// Dialogue Library Implementation
// ============================================================================

ValidationResult DialogueLibrary::register_graph(std::unique_ptr<DialogueGraph> graph) {
    ValidationResult result;
    if (!graph) {
        result.add_error("Null dialogue graph");
        return result;
    }

    std::string id = graph->get_id();
    result = validate_graph(*graph);

    if (!result.valid) {
        log(LogLevel::Error, "[DialogueLibrary] Dialogue graph '" + id + "' rejected:");
        for (const auto& error : result.errors) {
            log(LogLevel::Error, "[DialogueLibrary]   - " + error);
        }
        return result;
    }

    for (const auto& warning : result.warnings) {
        log(LogLevel::Warn, "[DialogueLibrary] '" + id + "': " + warning);
    }

    m_graphs[id] = std::move(graph);
    log(LogLevel::Info, "[DialogueLibrary] Dialogue graph registered: " + id);
    return result;
}

void DialogueLibrary::unregister_graph(const std::string& id) {
    m_graphs.erase(id);
}

const DialogueGraph* DialogueLibrary::get_graph(const std::string& id) const {
    auto it = m_graphs.find(id);
    return it != m_graphs.end() ? it->second.get() : nullptr;
}

bool DialogueLibrary::has_graph(const std::string& id) const {
    return m_graphs.count(id) > 0;
}

std::vector<std::string> DialogueLibrary::get_all_graph_ids() const {
    std::vector<std::string> ids;
    ids.reserve(m_graphs.size());
    for (const auto& [id, _] : m_graphs) {
        ids.push_back(id);
    }
    return ids;
}

ValidationResult DialogueLibrary::load_from_file(const std::string& path) {
    auto loaded = DialogueLoader::load_file(path);
    if (!loaded.graph) {
        ValidationResult result;
        result.add_error(loaded.error);
        return result;
    }
    return register_graph(std::move(loaded.graph));
}

void DialogueLibrary::clear() {
    m_graphs.clear();
}

} // namespace narrative::dialogue
