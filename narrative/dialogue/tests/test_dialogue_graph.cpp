#include <catch2/catch.hpp>
#include <narrative/dialogue/dialogue_graph.hpp>
#include <narrative/dialogue/dialogue_loader.hpp>
#include <narrative/core/filesystem.hpp>
#include <filesystem>
#include <string>
#include <vector>

using namespace narrative::dialogue;

namespace {

bool contains_message(const std::vector<std::string>& messages, const std::string& fragment) {
    for (const auto& message : messages) {
        if (message.find(fragment) != std::string::npos) return true;
    }
    return false;
}

std::unique_ptr<DialogueGraph> make_intro_graph() {
    return make_graph("intro_ab")
        .character("kapoor")
        .state(make_state("intro")
            .kind(StateKind::Intro)
            .text("Welcome to the physics department.")
            .option(make_option("A").text("Glad to be here").relationship(1).next("basics").build())
            .option(make_option("B").text("Whatever").relationship(-1).next("basics").build())
            .build())
        .state(make_state("basics").text("Let's start with the basics.").next("end").build())
        .state(make_state("end").kind(StateKind::Conclusion).text("See you tomorrow.").build())
        .initial("intro")
        .build();
}

} // namespace

// ============================================================================
// Graph & Builders
// ============================================================================

TEST_CASE("DialogueGraph builders", "[dialogue][graph]") {
    auto graph = make_intro_graph();

    REQUIRE(graph->get_id() == "intro_ab");
    REQUIRE(graph->get_character_id() == "kapoor");
    REQUIRE(graph->state_count() == 3);
    REQUIRE(graph->get_initial_state() == "intro");

    const DialogueState* intro = graph->get_state("intro");
    REQUIRE(intro != nullptr);
    REQUIRE(intro->kind == StateKind::Intro);
    REQUIRE(intro->options.size() == 2);
    REQUIRE(intro->find_option("A")->relationship_change == 1);
    REQUIRE(intro->find_option("missing") == nullptr);

    const DialogueState* end = graph->get_state("end");
    REQUIRE(end->is_conclusion);
    REQUIRE(end->is_terminal());

    REQUIRE(graph->index_of("basics") == 1);
    REQUIRE(graph->index_of("nowhere") == graph->state_count());
}

TEST_CASE("DialogueGraph topology", "[dialogue][graph]") {
    auto graph = make_graph("topology")
        .state(make_state("hub")
            .option(make_option("story").backstory("past").build())
            .option("left", "Left", "a")
            .next_if_score(2, "b")
            .build())
        .state(make_state("a").next("end").build())
        .state(make_state("b").next("end").build())
        .state(make_state("past").kind(StateKind::Backstory).build())
        .state(make_state("end").kind(StateKind::Conclusion).build())
        .initial("hub")
        .build();

    const DialogueState* hub = graph->get_state("hub");
    auto main = graph->main_successors(*hub);
    REQUIRE(main == std::vector<std::string>{"b", "a"});
    REQUIRE(graph->backstory_successors(*hub) == std::vector<std::string>{"past"});

    auto distances = graph->main_path_distances("hub");
    REQUIRE(distances.at("hub") == 0);
    REQUIRE(distances.at("a") == 1);
    REQUIRE(distances.at("end") == 2);
    REQUIRE(distances.count("past") == 0);

    auto skipping = graph->main_path_distances("hub", "a");
    REQUIRE(skipping.count("a") == 0);
    REQUIRE(skipping.at("end") == 2);
}

TEST_CASE("DialogueCondition evaluation", "[dialogue][graph]") {
    DialogueContext context;
    context.player_score = 2;
    context.visited_state_ids.insert("intro");
    context.selected_option_ids.push_back("A");

    DialogueCondition empty;
    REQUIRE(empty.evaluate(context));

    DialogueCondition score;
    score.min_score = 2;
    score.max_score = 4;
    REQUIRE(score.evaluate(context));
    context.player_score = 5;
    REQUIRE_FALSE(score.evaluate(context));

    DialogueCondition history;
    history.requires_visited = {"intro"};
    history.requires_options = {"A"};
    REQUIRE(history.evaluate(context));
    history.negate = true;
    REQUIRE_FALSE(history.evaluate(context));

    DialogueCondition custom;
    custom.custom_check = [](const DialogueContext& ctx) { return ctx.player_score > 10; };
    REQUIRE_FALSE(custom.evaluate(context));
}

TEST_CASE("DialogueOption resolved quality", "[dialogue][graph]") {
    REQUIRE(make_option("up").relationship(1).build().resolved_quality() == ChoiceQuality::Optimal);
    REQUIRE(make_option("down").relationship(-2).build().resolved_quality() == ChoiceQuality::NonOptimal);
    REQUIRE(make_option("flat").build().resolved_quality() == ChoiceQuality::Neutral);
    REQUIRE(make_option("explicit").relationship(1).quality(ChoiceQuality::Neutral).build()
                .resolved_quality() == ChoiceQuality::Neutral);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("validate_graph accepts well-formed graphs", "[dialogue][validation]") {
    SECTION("Linear intro") {
        auto result = validate_graph(*make_intro_graph());
        REQUIRE(result.valid);
        REQUIRE(result.errors.empty());
        REQUIRE(result.warnings.empty());
    }

    SECTION("Backstory is side content") {
        auto graph = make_graph("side")
            .state(make_state("intro")
                .option(make_option("ask").text("Tell me more").backstory("story").build())
                .option("go", "Moving on", "end")
                .build())
            .state(make_state("story").kind(StateKind::Backstory).text("Years ago...").build())
            .state(make_state("end").kind(StateKind::Conclusion).build())
            .initial("intro")
            .build();

        auto result = validate_graph(*graph);
        REQUIRE(result.valid);
    }

    SECTION("Mandatory state on every path") {
        auto graph = make_graph("gate")
            .state(make_state("intro").next("gate").build())
            .state(make_state("gate").mandatory().critical_path().next("end").build())
            .state(make_state("end").kind(StateKind::Conclusion).build())
            .initial("intro")
            .build();

        REQUIRE(validate_graph(*graph).valid);
    }
}

TEST_CASE("validate_graph reports authoring faults", "[dialogue][validation]") {
    SECTION("Missing initial state") {
        auto graph = make_graph("g")
            .state(make_state("end").kind(StateKind::Conclusion).build())
            .build();

        auto result = validate_graph(*graph);
        REQUIRE_FALSE(result.valid);
        REQUIRE(contains_message(result.errors, "No initial state"));

        graph->set_initial_state("nope");
        REQUIRE(contains_message(validate_graph(*graph).errors, "Initial state 'nope' not found"));
    }

    SECTION("Unknown references") {
        auto graph = make_graph("g")
            .state(make_state("intro").option("a", "A", "ghost").next("phantom").build())
            .initial("intro")
            .build();

        auto result = validate_graph(*graph);
        REQUIRE(contains_message(result.errors, "unknown next state 'phantom'"));
        REQUIRE(contains_message(result.errors, "unknown target 'ghost'"));
    }

    SECTION("Duplicate ids") {
        auto graph = make_graph("g")
            .state(make_state("intro").next("end").build())
            .state(make_state("intro").next("end").build())
            .state(make_state("end").kind(StateKind::Conclusion).build())
            .initial("intro")
            .build();

        REQUIRE(graph->state_count() == 2);
        REQUIRE(contains_message(validate_graph(*graph).errors, "Duplicate state id 'intro'"));
    }

    SECTION("Orphan state") {
        auto graph = make_graph("g")
            .state(make_state("intro").next("end").build())
            .state(make_state("orphan").next("end").build())
            .state(make_state("end").kind(StateKind::Conclusion).build())
            .initial("intro")
            .build();

        REQUIRE(contains_message(validate_graph(*graph).errors, "'orphan' is unreachable"));
    }

    SECTION("Dead end") {
        auto graph = make_graph("g")
            .state(make_state("intro").next("stuck").build())
            .state(make_state("stuck").text("...").build())
            .initial("intro")
            .build();

        auto result = validate_graph(*graph);
        REQUIRE(contains_message(result.errors, "'stuck' is a dead end"));
        REQUIRE(contains_message(result.warnings, "No conclusion is reachable"));
    }

    SECTION("Backstory misuse") {
        auto graph = make_graph("g")
            .state(make_state("intro")
                .option(make_option("fake").backstory("plain").build())
                .option(make_option("real").backstory("story").build())
                .next("end")
                .build())
            .state(make_state("plain").next("end").build())
            .state(make_state("story")
                .kind(StateKind::Backstory)
                .option(make_option("deeper").backstory("story").build())
                .build())
            .state(make_state("end").kind(StateKind::Conclusion).build())
            .initial("intro")
            .build();

        auto result = validate_graph(*graph);
        REQUIRE(contains_message(result.errors, "'plain' is not a backstory state"));
        REQUIRE(contains_message(result.errors, "nests further backstory"));
    }

    SECTION("Mandatory state can be bypassed") {
        auto graph = make_graph("g")
            .state(make_state("intro")
                .option("long", "Long way", "gate")
                .option("short", "Short way", "end")
                .build())
            .state(make_state("gate").mandatory().next("end").build())
            .state(make_state("end").kind(StateKind::Conclusion).build())
            .initial("intro")
            .build();

        REQUIRE(contains_message(validate_graph(*graph).errors, "'gate' can be bypassed"));
    }

    SECTION("Mandatory backstory") {
        auto graph = make_graph("g")
            .state(make_state("intro")
                .option(make_option("ask").backstory("story").build())
                .next("end")
                .build())
            .state(make_state("story").kind(StateKind::Backstory).mandatory().build())
            .state(make_state("end").kind(StateKind::Conclusion).build())
            .initial("intro")
            .build();

        REQUIRE(contains_message(validate_graph(*graph).errors, "'story' is optional backstory"));
    }

    SECTION("Critical path only reachable as backstory") {
        auto graph = make_graph("g")
            .state(make_state("intro")
                .option(make_option("ask").backstory("story").build())
                .next("end")
                .build())
            .state(make_state("story").kind(StateKind::Backstory).critical_path().build())
            .state(make_state("end").kind(StateKind::Conclusion).build())
            .initial("intro")
            .build();

        auto result = validate_graph(*graph);
        REQUIRE(result.valid);
        REQUIRE(contains_message(result.warnings, "only reachable as optional backstory"));
    }
}

// ============================================================================
// Loader & Library
// ============================================================================

namespace {

const char* CALIBRATION_JSON = R"({
    "id": "calibration",
    "title": "Calibration",
    "character": "kapoor",
    "initial_state": "intro",
    "states": [
        { "id": "intro", "kind": "intro", "text": "Morning.",
          "options": [
              { "id": "a", "text": "Ready", "next": "wrap", "relationship": 1, "insight": 5,
                "response": "Good.", "knowledge": { "concept": "dose", "domain": "dosimetry", "amount": 2 } },
              { "id": "ask", "text": "Your past?", "backstory": true, "next": "story" },
              { "id": "late", "text": "Later", "next": "wrap", "condition": { "min_score": 3 } }
          ] },
        { "id": "story", "kind": "backstory", "text": "Long ago.", "max_visits": 1 },
        { "id": "wrap", "kind": "transition", "critical_path": true,
          "conditional_next": [ { "condition": { "min_score": 1 }, "state": "great" } ],
          "next": "ok" },
        { "id": "great", "kind": "conclusion", "text": "Excellent." },
        { "id": "ok", "kind": "conclusion", "text": "Fine." }
    ]
})";

} // namespace

TEST_CASE("DialogueLoader parses authored documents", "[dialogue][loader]") {
    auto loaded = DialogueLoader::parse(CALIBRATION_JSON);
    REQUIRE(loaded.graph);
    REQUIRE(loaded.error.empty());

    const DialogueGraph& graph = *loaded.graph;
    REQUIRE(graph.get_title() == "Calibration");
    REQUIRE(graph.get_character_id() == "kapoor");
    REQUIRE(graph.state_count() == 5);

    const DialogueOption* a = graph.get_state("intro")->find_option("a");
    REQUIRE(a->relationship_change == 1);
    REQUIRE(a->insight_gain == 5);
    REQUIRE(a->response_text == std::optional<std::string>("Good."));
    REQUIRE(a->knowledge_gain->concept_id == "dose");
    REQUIRE(a->knowledge_gain->amount == 2);

    REQUIRE(graph.get_state("intro")->find_option("ask")->triggers_backstory);
    REQUIRE(graph.get_state("intro")->find_option("late")->condition->min_score == 3);

    const DialogueState* story = graph.get_state("story");
    REQUIRE(story->kind == StateKind::Backstory);
    REQUIRE(story->max_visits == std::optional<uint32_t>(1));

    const DialogueState* wrap = graph.get_state("wrap");
    REQUIRE(wrap->is_critical_path);
    REQUIRE(wrap->conditional_next.size() == 1);
    REQUIRE(wrap->conditional_next[0].state_id == "great");

    REQUIRE(graph.get_state("great")->is_conclusion);
    REQUIRE(validate_graph(graph).valid);
}

TEST_CASE("DialogueLoader rejects malformed documents", "[dialogue][loader]") {
    SECTION("Invalid JSON") {
        auto loaded = DialogueLoader::parse("{ not json");
        REQUIRE_FALSE(loaded.graph);
        REQUIRE_FALSE(loaded.error.empty());
    }

    SECTION("Missing states") {
        auto loaded = DialogueLoader::parse(R"({"id": "x"})");
        REQUIRE_FALSE(loaded.graph);
        REQUIRE(loaded.error.find("states") != std::string::npos);
    }

    SECTION("State without id") {
        auto loaded = DialogueLoader::parse(R"({"states": [ { "text": "hi" } ]})");
        REQUIRE_FALSE(loaded.graph);
    }

    SECTION("Missing file") {
        auto loaded = DialogueLoader::load_file("/nonexistent/narrative/dialogue.json");
        REQUIRE_FALSE(loaded.graph);
    }
}

TEST_CASE("DialogueLibrary registration", "[dialogue][library]") {
    DialogueLibrary library;

    SECTION("Valid graphs are registered") {
        auto result = library.register_graph(make_intro_graph());
        REQUIRE(result.valid);
        REQUIRE(library.has_graph("intro_ab"));
        REQUIRE(library.get_graph("intro_ab")->state_count() == 3);
        REQUIRE(library.get_all_graph_ids() == std::vector<std::string>{"intro_ab"});

        library.unregister_graph("intro_ab");
        REQUIRE(library.size() == 0);
    }

    SECTION("Invalid graphs are refused") {
        auto broken = make_graph("broken").state(make_state("intro").next("ghost").build()).build();
        auto result = library.register_graph(std::move(broken));
        REQUIRE_FALSE(result.valid);
        REQUIRE_FALSE(library.has_graph("broken"));
    }

    SECTION("Load from file") {
        auto path = (std::filesystem::temp_directory_path() / "narrative_dialogue_tests" / "calibration.json")
                        .string();
        REQUIRE(narrative::core::FileSystem::write_text(path, CALIBRATION_JSON));

        auto result = library.load_from_file(path);
        REQUIRE(result.valid);
        REQUIRE(library.has_graph("calibration"));
    }
}
