#include "commands.hpp"
#include <narrative/core/core.hpp>
#include <narrative/dialogue/dialogue.hpp>
#include <narrative/economy/economy.hpp>
#include <narrative/progression/progression.hpp>
#include <iostream>
#include <memory>
#include <sstream>

namespace narrative::cli {

using namespace narrative::dialogue;
using namespace narrative::progression;

std::vector<std::string> split_list(const std::string& text, char separator) {
    std::vector<std::string> items;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, separator)) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

namespace {

void print_messages(const char* label, const std::vector<std::string>& messages) {
    for (const auto& message : messages) {
        std::cout << "  " << label << ": " << message << "\n";
    }
}

// Prints the events a player would notice
std::vector<core::ScopedConnection> attach_printers(core::EventBus& bus) {
    std::vector<core::ScopedConnection> connections;

    connections.push_back(bus.subscribe<core::StateChangedEvent>([](const core::StateChangedEvent& e) {
        std::cout << "  -> " << e.to_state_id;
        if (e.entered_backstory) std::cout << " (backstory)";
        if (e.returned_from_backstory) std::cout << " (return)";
        if (e.synthetic) std::cout << " (repair)";
        std::cout << "\n";
    }));

    connections.push_back(bus.subscribe<core::ResourceChangedEvent>([](const core::ResourceChangedEvent& e) {
        std::cout << "     " << e.resource_id << " " << e.previous_value << " -> " << e.new_value << "\n";
    }));

    connections.push_back(bus.subscribe<core::MomentumResetEvent>([](const core::MomentumResetEvent& e) {
        std::cout << "     momentum reset (streak of " << e.streak_lost << " lost)\n";
    }));

    connections.push_back(bus.subscribe<core::ThresholdCrossedEvent>([](const core::ThresholdCrossedEvent& e) {
        std::cout << "     " << e.resource_id << " crossed " << e.label << " ("
                  << (e.direction == core::CrossingDirection::Up ? "up" : "down") << ")\n";
    }));

    connections.push_back(bus.subscribe<core::CriticalPathReachedEvent>([](const core::CriticalPathReachedEvent& e) {
        std::cout << "     critical path: " << e.state_id << "\n";
    }));

    connections.push_back(bus.subscribe<core::ProgressionRepairEvent>([](const core::ProgressionRepairEvent& e) {
        std::cout << "     repair " << e.from_state_id << " -> " << e.to_state_id << ": " << e.reason << "\n";
    }));

    connections.push_back(bus.subscribe<core::RewardGrantedEvent>([](const core::RewardGrantedEvent& e) {
        std::cout << "     reward " << e.reward_id << " " << (e.upgrade ? "upgraded to " : "granted at ")
                  << e.tier << " (" << e.source << ")\n";
    }));

    connections.push_back(bus.subscribe<core::ErrorEvent>([](const core::ErrorEvent& e) {
        std::cerr << "     error [" << e.category << "] " << e.message << "\n";
    }));

    return connections;
}

} // namespace

Result cmd_validate(const std::string& graph_path) {
    auto loaded = DialogueLoader::load_file(graph_path);
    if (!loaded.graph) {
        std::cerr << "Error: " << loaded.error << "\n";
        return Result::FileError;
    }

    const DialogueGraph& graph = *loaded.graph;
    auto result = validate_graph(graph);

    std::cout << "Dialogue '" << graph.get_id() << "' (" << graph.state_count() << " states)\n";
    print_messages("error", result.errors);
    print_messages("warning", result.warnings);

    if (!result.valid) {
        std::cout << "Invalid: " << result.errors.size() << " error(s)\n";
        return Result::Invalid;
    }

    std::cout << "Valid";
    if (!result.warnings.empty()) {
        std::cout << " with " << result.warnings.size() << " warning(s)";
    }
    std::cout << "\n";
    return Result::Success;
}

Result cmd_play(const PlayOptions& options) {
    core::NarrativeSettings& settings = core::NarrativeSettings::get();
    if (!options.settings_path.empty() && !settings.load(options.settings_path)) {
        std::cerr << "Error: Could not load settings from " << options.settings_path << "\n";
        return Result::FileError;
    }

    auto loaded = DialogueLoader::load_file(options.graph_path);
    if (!loaded.graph) {
        std::cerr << "Error: " << loaded.error << "\n";
        return Result::FileError;
    }

    auto validation = validate_graph(*loaded.graph);
    if (!validation.valid) {
        std::cerr << "Error: Dialogue '" << loaded.graph->get_id() << "' failed validation\n";
        print_messages("error", validation.errors);
        return Result::Invalid;
    }
    const DialogueGraph& graph = *loaded.graph;

    core::EventBus bus(settings.event_bus.history_capacity);
    core::TimerScheduler scheduler;
    economy::ResourceEconomy economy(bus, settings.economy);

    std::unique_ptr<IRewardStore> store;
    if (options.save_dir.empty()) {
        store = std::make_unique<MemoryRewardStore>();
    } else {
        store = std::make_unique<JsonRewardStore>(options.save_dir);
    }

    ProgressionGuard guard(options.save_id, *store, bus, scheduler, RetryPolicy::from_settings(settings.retry));
    auto printers = attach_printers(bus);

    DialogueSession session(bus, guard, options.reward_id, &economy, settings.dialogue);

    DialogueContext context;
    context.session_id = options.save_id + ":" + graph.get_id();

    std::cout << "Playing '" << (graph.get_title().empty() ? graph.get_id() : graph.get_title()) << "'\n";

    try {
        session.start(graph, context);

        size_t next_choice = 0;
        uint32_t steps = 0;
        const uint32_t max_steps = settings.dialogue.max_transitions * 2;

        while (session.is_active() && !session.machine().is_terminal() && steps++ < max_steps) {
            ViewState view = session.view();
            std::cout << "[" << view.id << "] " << view.text << "\n";

            if (!view.showing_response && !view.options.empty()) {
                std::string choice;
                if (next_choice < options.choices.size()) {
                    choice = options.choices[next_choice++];
                } else {
                    choice = view.options.front().id;
                }

                std::cout << "  > " << choice << "\n";
                session.select_option(choice);

                if (session.machine().is_showing_response()) {
                    std::cout << "  \"" << session.machine().current_text() << "\"\n";
                }
            }

            auto result = session.advance();
            if (!result.success && !result.terminal) {
                std::cerr << "Error: Session stalled at '" << session.machine().current_state_id()
                          << "': " << result.message << "\n";
                return Result::RuntimeError;
            }
        }

        if (!session.machine().is_terminal()) {
            std::cerr << "Error: Session did not reach a conclusion\n";
            return Result::RuntimeError;
        }

        const DialogueContext& final_context = session.machine().context();
        std::cout << "Conclusion: " << session.machine().current_state_id() << "\n";
        std::cout << "  score:    " << final_context.player_score << "\n";
        std::cout << "  insight:  " << final_context.insight_gained << "\n";
        std::cout << "  momentum: " << economy.momentum() << "\n";

        session.complete();

        // Let scheduled persistence retries run out
        for (int i = 0; i < 16 && guard.pending_retry_count() > 0; ++i) {
            scheduler.update(guard.policy().delay_for(guard.policy().max_attempts));
        }
    } catch (const core::NarrativeError& e) {
        std::cerr << "Error [" << e.category() << "]: " << e.what() << "\n";
        return Result::RuntimeError;
    }

    if (!options.reward_id.empty()) {
        auto reward = guard.get_reward(options.reward_id);
        if (reward && reward->granted) {
            std::cout << "Reward '" << options.reward_id << "': " << to_string(reward->granted_tier) << "\n";
        } else {
            std::cout << "Reward '" << options.reward_id << "': not granted\n";
        }
    }

    return Result::Success;
}

void cmd_help() {
    std::cout << R"(Narrative CLI - dialogue validation and playback

Usage: narrative-cli <command> [options]

Commands:
  validate <file>   Load a dialogue document and check its graph
                      Exit code 0 when valid, 1 when invalid

  play <file>       Run a scripted dialogue session
                      --choices <a,b,c>  Option ids to pick in order (default: first available)
                      --save-dir <dir>   Persist rewards as JSON under <dir>
                      --save-id <id>     Save slot for rewards (default: cli)
                      --reward <id>      Reward granted on completion (default: journal)
                      --settings <file>  Load settings from a JSON file

  help              Show this help message

Options:
  --verbose         Print engine debug logging
  -v, --version     Print version

Examples:
  narrative-cli validate samples/dialogues/calibration.json
  narrative-cli play samples/dialogues/calibration.json --choices precise,ask_story,buildup,investigate
)";
}

} // namespace narrative::cli
