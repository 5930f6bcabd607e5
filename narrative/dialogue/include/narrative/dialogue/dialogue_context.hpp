#pragma once

#include <string>
#include <vector>
#include <set>
#include <map>
#include <cstdint>

namespace narrative::dialogue {

// ============================================================================
// DialogueContext - per-session state, mutated only by the state machine
// ============================================================================

struct DialogueContext {
    std::string character_id;
    std::string session_id;

    // Never shrinks within a session
    std::set<std::string> visited_state_ids;
    std::vector<std::string> visit_order;
    std::map<std::string, uint32_t> visit_counts;

    std::vector<std::string> selected_option_ids;

    int32_t player_score = 0;           // Accumulated relationship change
    int32_t insight_gained = 0;
    std::map<std::string, int32_t> knowledge_gained;        // concept id -> amount
    std::map<std::string, bool> critical_path_progress;     // "state-<id>" / "option-<id>"

    double insight_multiplier = 1.0;

    // Helper methods
    bool has_visited(const std::string& state_id) const {
        return visited_state_ids.count(state_id) > 0;
    }

    uint32_t visit_count(const std::string& state_id) const {
        auto it = visit_counts.find(state_id);
        return it != visit_counts.end() ? it->second : 0;
    }

    bool has_selected(const std::string& option_id) const {
        for (const auto& id : selected_option_ids) {
            if (id == option_id) return true;
        }
        return false;
    }

    bool has_critical_progress() const {
        for (const auto& [checkpoint, reached] : critical_path_progress) {
            if (reached) return true;
        }
        return false;
    }
};

} // namespace narrative::dialogue
