#pragma once

#include <narrative/dialogue/dialogue_graph.hpp>
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>

namespace narrative::dialogue {

// ============================================================================
// DialogueLoader - builds graphs from authored JSON documents
//
// {
//   "id": "kapoor_calibration", "character": "kapoor", "initial_state": "intro",
//   "states": [
//     { "id": "intro", "kind": "intro", "text": "...",
//       "options": [ { "id": "a", "text": "...", "next": "basics",
//                      "relationship": 1, "insight": 5 } ] },
//     { "id": "wrap", "kind": "transition", "text": "...",
//       "conditional_next": [ { "condition": { "min_score": 3 }, "state": "great" } ],
//       "next": "ok" }
//   ]
// }
//
// Structural problems are reported by validate_graph(), not by the loader.
// ============================================================================

struct LoadResult {
    std::unique_ptr<DialogueGraph> graph;   // Null on failure
    std::string error;
};

class DialogueLoader {
public:
    static LoadResult load_file(const std::string& path);
    static LoadResult parse(const std::string& text);
    static LoadResult load_json(const nlohmann::json& document);
};

} // namespace narrative::dialogue
