#include <narrative/core/settings.hpp>
#include <narrative/core/filesystem.hpp>
#include <narrative/core/log.hpp>
#include <nlohmann/json.hpp>

namespace narrative::core {

using json = nlohmann::json;

NarrativeSettings& NarrativeSettings::get() {
    static NarrativeSettings instance;
    return instance;
}

bool NarrativeSettings::load(const std::string& path) {
    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        return false;
    }

    // Parse into a copy so a malformed document leaves the current values intact
    NarrativeSettings loaded = *this;

    try {
        json j = json::parse(content);

        if (j.contains("event_bus")) {
            auto& e = j["event_bus"];
            loaded.event_bus.history_capacity = e.value("history_capacity", loaded.event_bus.history_capacity);
        }

        if (j.contains("dialogue")) {
            auto& d = j["dialogue"];
            loaded.dialogue.default_max_visits = d.value("default_max_visits", loaded.dialogue.default_max_visits);
            loaded.dialogue.backstory_max_visits = d.value("backstory_max_visits", loaded.dialogue.backstory_max_visits);
            loaded.dialogue.max_transitions = d.value("max_transitions", loaded.dialogue.max_transitions);
            loaded.dialogue.annotated_tier_score = d.value("annotated_tier_score", loaded.dialogue.annotated_tier_score);
            loaded.dialogue.technical_tier_score = d.value("technical_tier_score", loaded.dialogue.technical_tier_score);
        }

        if (j.contains("economy")) {
            auto& e = j["economy"];
            loaded.economy.insight_min = e.value("insight_min", loaded.economy.insight_min);
            loaded.economy.insight_max = e.value("insight_max", loaded.economy.insight_max);
            loaded.economy.momentum_min = e.value("momentum_min", loaded.economy.momentum_min);
            loaded.economy.momentum_max = e.value("momentum_max", loaded.economy.momentum_max);
            loaded.economy.reframe_cost = e.value("reframe_cost", loaded.economy.reframe_cost);
            loaded.economy.extrapolate_cost = e.value("extrapolate_cost", loaded.economy.extrapolate_cost);
            loaded.economy.synthesis_cost = e.value("synthesis_cost", loaded.economy.synthesis_cost);
            loaded.economy.extrapolate_momentum = e.value("extrapolate_momentum", loaded.economy.extrapolate_momentum);
            loaded.economy.momentum_insight_bonus = e.value("momentum_insight_bonus", loaded.economy.momentum_insight_bonus);
        }

        if (j.contains("retry")) {
            auto& r = j["retry"];
            loaded.retry.max_attempts = r.value("max_attempts", loaded.retry.max_attempts);
            loaded.retry.initial_delay = r.value("initial_delay", loaded.retry.initial_delay);
            loaded.retry.backoff_multiplier = r.value("backoff_multiplier", loaded.retry.backoff_multiplier);
        }
    } catch (const json::exception& e) {
        log(LogLevel::Error, "[Settings] Failed to parse '" + path + "': " + e.what());
        return false;
    }

    *this = loaded;
    return true;
}

bool NarrativeSettings::save(const std::string& path) const {
    json j;

    j["event_bus"] = {
        {"history_capacity", event_bus.history_capacity}
    };

    j["dialogue"] = {
        {"default_max_visits", dialogue.default_max_visits},
        {"backstory_max_visits", dialogue.backstory_max_visits},
        {"max_transitions", dialogue.max_transitions},
        {"annotated_tier_score", dialogue.annotated_tier_score},
        {"technical_tier_score", dialogue.technical_tier_score}
    };

    j["economy"] = {
        {"insight_min", economy.insight_min},
        {"insight_max", economy.insight_max},
        {"momentum_min", economy.momentum_min},
        {"momentum_max", economy.momentum_max},
        {"reframe_cost", economy.reframe_cost},
        {"extrapolate_cost", economy.extrapolate_cost},
        {"synthesis_cost", economy.synthesis_cost},
        {"extrapolate_momentum", economy.extrapolate_momentum},
        {"momentum_insight_bonus", economy.momentum_insight_bonus}
    };

    j["retry"] = {
        {"max_attempts", retry.max_attempts},
        {"initial_delay", retry.initial_delay},
        {"backoff_multiplier", retry.backoff_multiplier}
    };

    return FileSystem::write_text(path, j.dump(4));
}

void NarrativeSettings::reset() {
    *this = NarrativeSettings{};
}

} // namespace narrative::core
