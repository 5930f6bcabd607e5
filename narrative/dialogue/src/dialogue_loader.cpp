#include <narrative/dialogue/dialogue_loader.hpp>
#include <narrative/core/filesystem.hpp>
#include <narrative/core/log.hpp>
#include <nlohmann/json.hpp>

namespace narrative::dialogue {

using namespace narrative::core;
using json = nlohmann::json;

namespace {

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> result;
    if (j.contains(key)) {
        for (const auto& item : j.at(key)) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

DialogueCondition parse_condition(const json& j) {
    DialogueCondition condition;
    if (j.contains("min_score")) condition.min_score = j.at("min_score").get<int32_t>();
    if (j.contains("max_score")) condition.max_score = j.at("max_score").get<int32_t>();
    condition.requires_visited = string_list(j, "requires_visited");
    condition.requires_options = string_list(j, "requires_options");
    condition.negate = j.value("negate", false);
    return condition;
}

DialogueOption parse_option(const json& j) {
    DialogueOption option;
    option.id = j.at("id").get<std::string>();
    option.text = j.value("text", "");
    option.next_state_id = j.value("next", "");

    if (j.contains("response")) {
        option.response_text = j.at("response").get<std::string>();
    }

    option.insight_gain = j.value("insight", 0);
    option.relationship_change = j.value("relationship", 0);

    if (j.contains("knowledge")) {
        const auto& k = j.at("knowledge");
        option.knowledge_gain = KnowledgeGain{
            k.at("concept").get<std::string>(),
            k.value("domain", ""),
            k.value("amount", 0)
        };
    }

    option.triggers_backstory = j.value("backstory", false);
    option.is_critical_path = j.value("critical_path", false);
    option.quality = economy::choice_quality_from_string(j.value("quality", "auto"));

    if (j.contains("condition")) {
        option.condition = parse_condition(j.at("condition"));
    }

    return option;
}

DialogueState parse_state(const json& j) {
    DialogueState state;
    state.id = j.at("id").get<std::string>();

    std::string kind = j.value("kind", "question");
    auto parsed_kind = state_kind_from_string(kind);
    if (!parsed_kind) {
        log(LogLevel::Warn, "[DialogueLoader] State '" + state.id + "' has unknown kind '" + kind +
            "', treating as question");
    }
    state.kind = parsed_kind.value_or(StateKind::Question);

    state.text = j.value("text", "");
    state.next_state_id = j.value("next", "");
    state.is_mandatory = j.value("mandatory", false);
    state.is_critical_path = j.value("critical_path", false);
    state.is_conclusion = j.value("conclusion", state.kind == StateKind::Conclusion);

    if (j.contains("max_visits")) {
        state.max_visits = j.at("max_visits").get<uint32_t>();
    }

    if (j.contains("options")) {
        for (const auto& option : j.at("options")) {
            state.options.push_back(parse_option(option));
        }
    }

    if (j.contains("conditional_next")) {
        for (const auto& branch : j.at("conditional_next")) {
            ConditionalNext next;
            next.state_id = branch.at("state").get<std::string>();
            if (branch.contains("condition")) {
                next.condition = parse_condition(branch.at("condition"));
            }
            state.conditional_next.push_back(std::move(next));
        }
    }

    return state;
}

} // namespace

LoadResult DialogueLoader::load_file(const std::string& path) {
    auto content = FileSystem::read_text(path);
    if (content.empty()) {
        LoadResult result;
        result.error = "Failed to read dialogue file: " + path;
        log(LogLevel::Error, "[DialogueLoader] " + result.error);
        return result;
    }

    LoadResult result = parse(content);
    if (result.graph) {
        log(LogLevel::Debug, "[DialogueLoader] Loaded dialogue: " + path);
    }
    return result;
}

LoadResult DialogueLoader::parse(const std::string& text) {
    try {
        return load_json(json::parse(text));
    } catch (const json::exception& e) {
        LoadResult result;
        result.error = "JSON parse error: " + std::string(e.what());
        log(LogLevel::Error, "[DialogueLoader] " + result.error);
        return result;
    }
}

LoadResult DialogueLoader::load_json(const json& document) {
    LoadResult result;

    if (!document.is_object() || !document.contains("states") || !document.at("states").is_array()) {
        result.error = "Invalid dialogue document: missing 'states' array";
        log(LogLevel::Error, "[DialogueLoader] " + result.error);
        return result;
    }

    try {
        auto graph = std::make_unique<DialogueGraph>(document.value("id", ""));
        graph->set_title(document.value("title", ""));
        graph->set_character_id(document.value("character", ""));
        graph->set_initial_state(document.value("initial_state", ""));

        for (const auto& state : document.at("states")) {
            graph->add_state(parse_state(state));
        }

        result.graph = std::move(graph);
    } catch (const json::exception& e) {
        result.error = "Invalid dialogue document: " + std::string(e.what());
        log(LogLevel::Error, "[DialogueLoader] " + result.error);
    }

    return result;
}

} // namespace narrative::dialogue
