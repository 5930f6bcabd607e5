#include <catch2/catch.hpp>
#include <narrative/progression/dialogue_session.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace narrative;
using namespace narrative::dialogue;
using namespace narrative::progression;

namespace {

std::unique_ptr<DialogueGraph> calibration_graph() {
    return make_graph("calibration")
        .character("kapoor")
        .state(make_state("intro")
            .kind(StateKind::Intro)
            .option(make_option("A").text("Measured answer").relationship(1).next("wrap").build())
            .option(make_option("B").text("Guess").relationship(-1).next("wrap").build())
            .build())
        .state(make_state("wrap")
            .kind(StateKind::Transition)
            .critical_path()
            .next_if_score(1, "great")
            .next("ok")
            .build())
        .state(make_state("great").kind(StateKind::Conclusion).text("Well done.").build())
        .state(make_state("ok").kind(StateKind::Conclusion).text("Adequate.").build())
        .initial("intro")
        .build();
}

// intro offers a shortcut straight to the conclusion past the critical beat
std::unique_ptr<DialogueGraph> shortcut_graph() {
    return make_graph("shortcut")
        .state(make_state("intro")
            .kind(StateKind::Intro)
            .option("skip", "Not now", "end")
            .option("go", "Show me", "journal")
            .build())
        .state(make_state("journal").critical_path().next("end").build())
        .state(make_state("end").kind(StateKind::Conclusion).build())
        .initial("intro")
        .build();
}

// Backstory detour, a critical beat and tiered conclusions
std::unique_ptr<DialogueGraph> branching_graph() {
    return make_graph("branching")
        .state(make_state("intro")
            .kind(StateKind::Intro)
            .option(make_option("precise").relationship(1).next("basics").build())
            .option(make_option("casual").relationship(-1).next("basics").build())
            .build())
        .state(make_state("basics")
            .kind(StateKind::Question)
            .mandatory()
            .option(make_option("story").backstory("story").build())
            .option(make_option("go").next("tolerance").build())
            .build())
        .state(make_state("story").kind(StateKind::Backstory).max_visits(1).build())
        .state(make_state("tolerance")
            .kind(StateKind::CriticalMoment)
            .critical_path()
            .option(make_option("accept").next("wrap").build())
            .option(make_option("push").relationship(1).next("wrap").build())
            .build())
        .state(make_state("wrap")
            .kind(StateKind::Transition)
            .next_if_score(2, "great")
            .next("ok")
            .build())
        .state(make_state("great").kind(StateKind::Conclusion).build())
        .state(make_state("ok").kind(StateKind::Conclusion).build())
        .initial("intro")
        .build();
}

struct Walk {
    bool terminal = false;
    uint32_t steps = 0;
    std::vector<std::string> open_options;   // Set when the choices ran out first
};

constexpr uint32_t WALK_STEP_LIMIT = 64;

// Plays `choices` in order on a fresh session
Walk walk(const DialogueGraph& graph, const std::vector<std::string>& choices) {
    core::EventBus bus;
    core::TimerScheduler scheduler;
    MemoryRewardStore store;
    ProgressionGuard guard("walk", store, bus, scheduler);
    DialogueSession session(bus, guard, "journal");
    session.start(graph, DialogueContext{});

    Walk result;
    size_t next = 0;
    while (!session.machine().is_terminal() && result.steps < WALK_STEP_LIMIT) {
        result.steps++;
        auto options = session.machine().available_options();
        if (!options.empty()) {
            if (next == choices.size()) {
                for (const auto* option : options) {
                    result.open_options.push_back(option->id);
                }
                return result;
            }
            session.select_option(choices[next++]);
        }
        session.advance();
    }

    result.terminal = session.machine().is_terminal();
    return result;
}

struct SessionFixture {
    core::EventBus bus;
    core::TimerScheduler scheduler;
    MemoryRewardStore store;
    ProgressionGuard guard{"slot-1", store, bus, scheduler};
    std::unique_ptr<DialogueGraph> graph = calibration_graph();

    DialogueContext context() {
        DialogueContext ctx;
        ctx.session_id = "session-1";
        return ctx;
    }

    std::vector<core::RewardGrantedEvent> grants() const {
        std::vector<core::RewardGrantedEvent> result;
        for (const auto& event : bus.history(core::EventType::RewardGranted)) {
            result.push_back(*event.get_if<core::RewardGrantedEvent>());
        }
        return result;
    }

    size_t grant_count() const {
        return bus.history(core::EventType::RewardGranted).size();
    }

    void play_to_end(DialogueSession& session, const std::string& option) {
        session.start(*graph, context());
        session.select_option(option);
        session.advance();
        session.advance();
    }
};

} // namespace

TEST_CASE_METHOD(SessionFixture, "Normal completion grants once", "[progression][session]") {
    DialogueSession session(bus, guard, "journal");
    play_to_end(session, "A");
    REQUIRE(session.machine().is_terminal());

    std::vector<std::string> seen;
    auto result = session.complete([&](const SessionSummary& summary) {
        seen.push_back(summary.final_state_id);
    });

    REQUIRE(result.has_value());
    REQUIRE(result->outcome == GrantOutcome::Granted);
    REQUIRE(result->tier == RewardTier::Technical);
    REQUIRE(seen == std::vector<std::string>{"great"});
    REQUIRE(session.is_completed());
    REQUIRE_FALSE(session.is_active());

    auto events = grants();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].source == "completion");
}

TEST_CASE_METHOD(SessionFixture, "Complete before the conclusion does nothing", "[progression][session]") {
    DialogueSession session(bus, guard, "journal");
    session.start(*graph, context());

    REQUIRE_FALSE(session.complete().has_value());
    REQUIRE_FALSE(guard.is_granted("journal"));
    REQUIRE(session.is_active());
}

TEST_CASE_METHOD(SessionFixture, "A throwing completion handler falls back", "[progression][session]") {
    DialogueSession session(bus, guard, "journal");
    play_to_end(session, "B");

    auto result = session.complete([](const SessionSummary&) {
        throw std::runtime_error("journal overlay failed to open");
    });

    REQUIRE(result.has_value());
    REQUIRE(result->outcome == GrantOutcome::Granted);
    REQUIRE(result->tier == RewardTier::Base);
    REQUIRE(grants().front().source == "completion_fallback");
}

TEST_CASE_METHOD(SessionFixture, "Teardown safety net grants after critical progress", "[progression][session]") {
    {
        DialogueSession session(bus, guard, "journal");
        session.start(*graph, context());
        session.select_option("A");
        session.advance();
        REQUIRE(session.machine().context().has_critical_progress());
    }

    REQUIRE(guard.is_granted("journal"));
    auto events = grants();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].source == "teardown_safety_net");
    REQUIRE(bus.history(core::EventType::DialogueAbandoned).size() == 1);
}

TEST_CASE_METHOD(SessionFixture, "No grant without critical progress", "[progression][session]") {
    {
        DialogueSession session(bus, guard, "journal");
        session.start(*graph, context());
        REQUIRE_FALSE(session.abandon("player left").has_value());
    }

    REQUIRE_FALSE(guard.is_granted("journal"));
    REQUIRE(grants().empty());
}

TEST_CASE_METHOD(SessionFixture, "Every exit path funnels through the guard", "[progression][session]") {
    RewardRule rule;
    rule.reward_id = "journal";
    rule.trigger_state_id = "wrap";
    rule.tier = RewardTier::Base;
    guard.add_rule(rule);

    {
        DialogueSession session(bus, guard, "journal");
        play_to_end(session, "A");

        // Rule fired on reaching wrap
        REQUIRE(guard.get_reward("journal")->granted_tier == RewardTier::Base);

        auto completed = session.complete();
        REQUIRE(completed->outcome == GrantOutcome::Upgraded);

        REQUIRE_FALSE(session.abandon().has_value());
    }

    DialogueSession replay(bus, guard, "journal");
    replay.start(*graph, context());
    replay.select_option("A");
    replay.advance();
    auto abandoned = replay.abandon("closed");
    REQUIRE(abandoned.has_value());
    REQUIRE(abandoned->outcome == GrantOutcome::AlreadyGranted);

    auto events = grants();
    REQUIRE(events.size() == 2);
    REQUIRE(guard.get_reward("journal")->granted_tier == RewardTier::Technical);
    REQUIRE(store.successful_write_count() == 2);
}

TEST_CASE_METHOD(SessionFixture, "Loop errors fall back to repair", "[progression][session]") {
    auto broken = make_graph("broken")
        .state(make_state("a").next("b").build())
        .state(make_state("b").next("a").build())
        .state(make_state("goal").critical_path().next("end").build())
        .state(make_state("end").kind(StateKind::Conclusion).build())
        .initial("a")
        .build();

    DialogueSession session(bus, guard, "journal");
    session.start(*broken, context());
    session.advance();

    auto repaired = session.advance();
    REQUIRE(repaired.success);
    REQUIRE(repaired.to_state_id == "goal");
    REQUIRE(session.repair_count() == 1);
    REQUIRE(bus.history(core::EventType::ProgressionRepair).size() == 1);

    REQUIRE(session.advance().terminal);
    REQUIRE(session.complete()->outcome == GrantOutcome::Granted);
}

TEST_CASE_METHOD(SessionFixture, "Invalid options are re-prompted", "[progression][session]") {
    DialogueSession session(bus, guard, "journal");
    session.start(*graph, context());

    REQUIRE_THROWS_AS(session.select_option("C"), core::InvalidOptionError);
    REQUIRE(session.repair_count() == 0);

    auto view = session.view();
    REQUIRE(view.id == "intro");
    REQUIRE(view.options.size() == 2);
}

TEST_CASE_METHOD(SessionFixture, "Sessions without a reward grant nothing", "[progression][session]") {
    DialogueSession session(bus, guard, "");
    play_to_end(session, "A");

    REQUIRE_FALSE(session.complete().has_value());
    REQUIRE(grants().empty());
}

TEST_CASE_METHOD(SessionFixture, "Skipping the critical beat earns nothing on any exit", "[progression][session]") {
    auto shortcut = shortcut_graph();
    REQUIRE(validate_graph(*shortcut).valid);

    SECTION("Completion") {
        DialogueSession session(bus, guard, "journal");
        session.start(*shortcut, context());
        session.select_option("skip");
        REQUIRE(session.advance().terminal);

        REQUIRE_FALSE(session.complete().has_value());
        REQUIRE(session.is_completed());
    }

    SECTION("Teardown of the same terminal session") {
        DialogueSession session(bus, guard, "journal");
        session.start(*shortcut, context());
        session.select_option("skip");
        REQUIRE(session.advance().terminal);
    }

    REQUIRE_FALSE(guard.is_granted("journal"));
    REQUIRE(grant_count() == 0);
}

TEST_CASE_METHOD(SessionFixture, "Reaching the critical beat earns it on any exit", "[progression][session]") {
    auto shortcut = shortcut_graph();
    std::string expected_source;

    SECTION("Completion") {
        DialogueSession session(bus, guard, "journal");
        session.start(*shortcut, context());
        session.select_option("go");
        session.advance();
        REQUIRE(session.advance().terminal);

        REQUIRE(session.complete()->outcome == GrantOutcome::Granted);
        expected_source = "completion";
    }

    SECTION("Teardown of the same terminal session") {
        {
            DialogueSession session(bus, guard, "journal");
            session.start(*shortcut, context());
            session.select_option("go");
            session.advance();
            REQUIRE(session.advance().terminal);
        }
        expected_source = "teardown_safety_net";
    }

    REQUIRE(guard.is_granted("journal"));
    auto events = grants();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].source == expected_source);
}

TEST_CASE("Every option sequence reaches a conclusion", "[progression][session]") {
    auto graph = branching_graph();
    REQUIRE(validate_graph(*graph).valid);

    std::vector<std::vector<std::string>> frontier{{}};
    size_t finished = 0;

    while (!frontier.empty()) {
        std::vector<std::string> choices = frontier.back();
        frontier.pop_back();

        Walk result = walk(*graph, choices);
        if (!result.open_options.empty()) {
            for (const auto& option : result.open_options) {
                auto extended = choices;
                extended.push_back(option);
                frontier.push_back(extended);
            }
            continue;
        }

        INFO("after " << choices.size() << " choices");
        REQUIRE(result.terminal);
        REQUIRE(result.steps < WALK_STEP_LIMIT);
        finished++;
    }

    // Includes the replayed backstory that only repair can resolve
    REQUIRE(finished > 4);
}

TEST_CASE_METHOD(SessionFixture, "A blocked repair target is repaired again", "[progression][session]") {
    auto broken = make_graph("broken")
        .state(make_state("a").next("b").build())
        .state(make_state("b").next("a").build())
        .state(make_state("stuck").critical_path().build())
        .state(make_state("end").kind(StateKind::Conclusion).build())
        .initial("a")
        .build();

    DialogueSession session(bus, guard, "journal");
    session.start(*broken, context());
    session.advance();

    auto first = session.advance();
    REQUIRE(first.to_state_id == "stuck");
    REQUIRE(session.machine().get_progression_status().blocked);

    auto second = session.advance();
    REQUIRE(second.success);
    REQUIRE(second.to_state_id == "end");
    REQUIRE(second.terminal);
    REQUIRE(session.repair_count() == 2);
    REQUIRE(bus.history(core::EventType::ProgressionRepair).size() == 2);

    REQUIRE(session.complete()->outcome == GrantOutcome::Granted);
}
