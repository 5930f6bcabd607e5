#pragma once

#include <narrative/dialogue/dialogue_state.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <memory>

namespace narrative::dialogue {

// ============================================================================
// Dialogue Graph
//
// Author-supplied and immutable once handed to a state machine.
// ============================================================================

class DialogueGraph {
public:
    DialogueGraph() = default;
    explicit DialogueGraph(const std::string& id);

    // ========================================================================
    // Properties
    // ========================================================================

    const std::string& get_id() const { return m_id; }
    void set_id(const std::string& id) { m_id = id; }

    const std::string& get_title() const { return m_title; }
    void set_title(const std::string& title) { m_title = title; }

    const std::string& get_character_id() const { return m_character_id; }
    void set_character_id(const std::string& character_id) { m_character_id = character_id; }

    // ========================================================================
    // States
    // ========================================================================

    // A repeated id keeps the first state and is reported by validate_graph()
    void add_state(DialogueState state);
    const DialogueState* get_state(const std::string& id) const;
    bool has_state(const std::string& id) const;
    const std::vector<DialogueState>& get_states() const { return m_states; }
    size_t state_count() const { return m_states.size(); }

    // Declaration index, used as a stable tie-breaker
    size_t index_of(const std::string& id) const;

    const std::vector<std::string>& get_duplicate_ids() const { return m_duplicate_ids; }

    // ========================================================================
    // Entry
    // ========================================================================

    void set_initial_state(const std::string& state_id) { m_initial_state_id = state_id; }
    const std::string& get_initial_state() const { return m_initial_state_id; }

    // ========================================================================
    // Topology
    // ========================================================================

    // Targets of next, conditional branches and non-backstory options
    std::vector<std::string> main_successors(const DialogueState& state) const;

    // Targets of backstory-triggering options
    std::vector<std::string> backstory_successors(const DialogueState& state) const;

    // Breadth-first distances over main-path edges. States that are not
    // reachable are absent. `skip` is treated as removed from the graph.
    std::unordered_map<std::string, size_t> main_path_distances(const std::string& from,
                                                                const std::string& skip = {}) const;

private:
    std::string m_id;
    std::string m_title;
    std::string m_character_id;
    std::string m_initial_state_id;

    std::vector<DialogueState> m_states;
    std::unordered_map<std::string, size_t> m_state_index;
    std::vector<std::string> m_duplicate_ids;
};

// ============================================================================
// Validation
// ============================================================================

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(const std::string& message) {
        errors.push_back(message);
        valid = false;
    }

    void add_warning(const std::string& message) {
        warnings.push_back(message);
    }
};

// Authoring-time gate. The state machine assumes a graph that passed.
ValidationResult validate_graph(const DialogueGraph& graph);

// ============================================================================
// Dialogue Graph Builder
// ============================================================================

class DialogueGraphBuilder {
public:
    DialogueGraphBuilder(const std::string& id) {
        m_graph = std::make_unique<DialogueGraph>(id);
    }

    DialogueGraphBuilder& title(const std::string& title) {
        m_graph->set_title(title);
        return *this;
    }

    DialogueGraphBuilder& character(const std::string& character_id) {
        m_graph->set_character_id(character_id);
        return *this;
    }

    DialogueGraphBuilder& state(DialogueState s) {
        m_graph->add_state(std::move(s));
        return *this;
    }

    DialogueGraphBuilder& initial(const std::string& state_id) {
        m_graph->set_initial_state(state_id);
        return *this;
    }

    std::unique_ptr<DialogueGraph> build() { return std::move(m_graph); }

private:
    std::unique_ptr<DialogueGraph> m_graph;
};

inline DialogueGraphBuilder make_graph(const std::string& id) {
    return DialogueGraphBuilder(id);
}

// ============================================================================
// Dialogue Library - validated graphs by id
// ============================================================================

class DialogueLibrary {
public:
    DialogueLibrary() = default;

    DialogueLibrary(const DialogueLibrary&) = delete;
    DialogueLibrary& operator=(const DialogueLibrary&) = delete;

    // Refuses graphs that fail validation; the result lists why
    ValidationResult register_graph(std::unique_ptr<DialogueGraph> graph);
    void unregister_graph(const std::string& id);

    const DialogueGraph* get_graph(const std::string& id) const;
    bool has_graph(const std::string& id) const;
    std::vector<std::string> get_all_graph_ids() const;
    size_t size() const { return m_graphs.size(); }

    // Load a JSON dialogue document and register it
    ValidationResult load_from_file(const std::string& path);

    void clear();

private:
    std::unordered_map<std::string, std::unique_ptr<DialogueGraph>> m_graphs;
};

} // namespace narrative::dialogue
