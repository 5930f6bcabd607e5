#include <catch2/catch.hpp>
#include <narrative/core/event_bus.hpp>
#include <narrative/core/errors.hpp>
#include <narrative/core/log.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace narrative::core;

namespace {

// Collects log lines so tests can assert on diagnostics
class CaptureSink : public ILogSink {
public:
    CaptureSink() { add_log_sink(this); }
    ~CaptureSink() override { remove_log_sink(this); }

    void log(LogLevel level, const std::string& category, const std::string& message) override {
        if (level >= LogLevel::Error) {
            errors.push_back(category + ": " + message);
        }
    }

    std::vector<std::string> errors;
};

ResourceChangedEvent resource_event(int32_t value) {
    ResourceChangedEvent e;
    e.resource_id = "insight";
    e.new_value = value;
    return e;
}

} // namespace

TEST_CASE("EventBus subscription and dispatch", "[core][event_bus]") {
    EventBus bus;

    SECTION("Subscribe and receive typed payload") {
        int32_t received = 0;
        auto conn = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent& e) {
            received = e.new_value;
        });

        bus.dispatch(resource_event(42), "test");
        REQUIRE(received == 42);
    }

    SECTION("Handlers run in subscription order before dispatch returns") {
        std::vector<int> order;
        auto conn1 = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) { order.push_back(1); });
        auto conn2 = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) { order.push_back(2); });
        auto conn3 = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) { order.push_back(3); });

        bus.dispatch(resource_event(1));
        REQUIRE(order == std::vector<int>{1, 2, 3});
    }

    SECTION("Channels are isolated") {
        int resource_count = 0;
        int reward_count = 0;
        auto conn1 = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) { resource_count++; });
        auto conn2 = bus.subscribe<RewardGrantedEvent>([&](const RewardGrantedEvent&) { reward_count++; });

        bus.dispatch(resource_event(1));
        REQUIRE(resource_count == 1);
        REQUIRE(reward_count == 0);

        bus.dispatch(RewardGrantedEvent{"save", "journal", "base", "", false, "test"});
        REQUIRE(resource_count == 1);
        REQUIRE(reward_count == 1);
    }

    SECTION("Untyped subscription receives the full record") {
        Event received;
        auto conn = bus.subscribe(EventType::RewardGranted, [&](const Event& e) {
            received = e;
        });

        bus.dispatch(RewardGrantedEvent{"save", "journal", "base", "", false, "test"}, "guard");

        REQUIRE(received.type == EventType::RewardGranted);
        REQUIRE(received.source == "guard");
        REQUIRE(received.sequence > 0);
        REQUIRE(received.timestamp > 0);
        const auto* payload = received.get_if<RewardGrantedEvent>();
        REQUIRE(payload != nullptr);
        REQUIRE(payload->reward_id == "journal");
    }

    SECTION("Missing source is recorded as unknown") {
        std::string source;
        auto conn = bus.subscribe(EventType::ResourceChanged, [&](const Event& e) { source = e.source; });

        bus.dispatch(resource_event(1));
        REQUIRE(source == "unknown");
    }
}

TEST_CASE("EventBus ScopedConnection", "[core][event_bus]") {
    EventBus bus;

    SECTION("Connection disconnects on destruction") {
        int count = 0;
        {
            auto conn = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) { count++; });
            bus.dispatch(resource_event(1));
            REQUIRE(count == 1);
            REQUIRE(bus.handler_count(EventType::ResourceChanged) == 1);
        }
        bus.dispatch(resource_event(1));
        REQUIRE(count == 1);
        REQUIRE(bus.handler_count(EventType::ResourceChanged) == 0);
    }

    SECTION("Manual disconnect") {
        int count = 0;
        auto conn = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) { count++; });
        conn.disconnect();
        REQUIRE_FALSE(conn.connected());

        bus.dispatch(resource_event(1));
        REQUIRE(count == 0);
    }

    SECTION("Moved connection keeps the subscription") {
        int count = 0;
        ScopedConnection kept;
        {
            auto conn = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) { count++; });
            kept = std::move(conn);
        }
        bus.dispatch(resource_event(1));
        REQUIRE(count == 1);
    }

    SECTION("Connection outliving the bus is harmless") {
        ScopedConnection conn;
        {
            EventBus local;
            conn = local.subscribe<ResourceChangedEvent>([](const ResourceChangedEvent&) {});
        }
        conn.disconnect();
        REQUIRE_FALSE(conn.connected());
    }
}

TEST_CASE("EventBus fault isolation", "[core][event_bus]") {
    EventBus bus;
    CaptureSink sink;

    bool first_ran = false;
    bool third_ran = false;
    std::vector<ErrorEvent> reported;

    auto conn1 = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) { first_ran = true; });
    auto conn2 = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) {
        throw std::runtime_error("renderer exploded");
    });
    auto conn3 = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) { third_ran = true; });
    auto diag = bus.subscribe<ErrorEvent>([&](const ErrorEvent& e) { reported.push_back(e); });

    REQUIRE_NOTHROW(bus.dispatch(resource_event(5), "economy"));

    SECTION("Remaining handlers still run") {
        REQUIRE(first_ran);
        REQUIRE(third_ran);
    }

    SECTION("Failure is reported on the diagnostic channel") {
        REQUIRE(bus.handler_failure_count() == 1);
        REQUIRE(reported.size() == 1);
        REQUIRE(reported[0].category == "handler_failure");
        REQUIRE(reported[0].message == "renderer exploded");
        REQUIRE(reported[0].detail == "RESOURCE_CHANGED");
    }

    SECTION("Failure is logged with type and source") {
        REQUIRE_FALSE(sink.errors.empty());
        const std::string& line = sink.errors.front();
        REQUIRE(line.find("EventBus") != std::string::npos);
        REQUIRE(line.find("RESOURCE_CHANGED") != std::string::npos);
        REQUIRE(line.find("economy") != std::string::npos);
    }
}

TEST_CASE("EventBus failing error handler is only logged", "[core][event_bus]") {
    EventBus bus;
    int error_calls = 0;

    auto conn = bus.subscribe<ErrorEvent>([&](const ErrorEvent&) {
        error_calls++;
        throw std::runtime_error("diagnostics down");
    });

    REQUIRE_NOTHROW(bus.dispatch(ErrorEvent{"graph_error", "bad", "test", ""}));
    REQUIRE(error_calls == 1);
    REQUIRE(bus.handler_failure_count() == 1);
}

TEST_CASE("EventBus re-entrancy guard", "[core][event_bus]") {
    EventBus bus;

    SECTION("Same-type dispatch from a handler throws") {
        auto conn = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent& e) {
            bus.dispatch(resource_event(e.new_value + 1));
        });

        REQUIRE_THROWS_AS(bus.dispatch(resource_event(1)), ReentrantDispatchError);
        REQUIRE_FALSE(bus.is_dispatching(EventType::ResourceChanged));
    }

    SECTION("Violation is reported before the throw") {
        std::vector<ErrorEvent> reported;
        auto diag = bus.subscribe<ErrorEvent>([&](const ErrorEvent& e) { reported.push_back(e); });
        auto conn = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) {
            bus.dispatch(resource_event(0));
        });

        try {
            bus.dispatch(resource_event(1));
            FAIL("expected ReentrantDispatchError");
        } catch (const ReentrantDispatchError& e) {
            REQUIRE(e.event_type() == EventType::ResourceChanged);
            REQUIRE(std::string(e.category()) == "reentrant_dispatch");
        }

        REQUIRE(reported.size() == 1);
        REQUIRE(reported[0].category == "reentrant_dispatch");
    }

    SECTION("Dispatching another type from a handler is allowed") {
        int reward_count = 0;
        auto reward = bus.subscribe<RewardGrantedEvent>([&](const RewardGrantedEvent&) { reward_count++; });
        auto conn = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent&) {
            bus.dispatch(RewardGrantedEvent{"save", "journal", "base", "", false, "test"});
        });

        REQUIRE_NOTHROW(bus.dispatch(resource_event(1)));
        REQUIRE(reward_count == 1);
    }

    SECTION("Queued same-type events are delivered on flush") {
        std::vector<int32_t> values;
        auto conn = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent& e) {
            values.push_back(e.new_value);
            if (e.new_value < 3) {
                bus.queue(resource_event(e.new_value + 1));
            }
        });

        bus.dispatch(resource_event(1));
        REQUIRE(values == std::vector<int32_t>{1});
        REQUIRE(bus.has_queued_events());

        bus.flush();
        REQUIRE(values == std::vector<int32_t>{1, 2});

        bus.flush();
        REQUIRE(values == std::vector<int32_t>{1, 2, 3});
        REQUIRE_FALSE(bus.has_queued_events());
    }
}

TEST_CASE("EventBus deferred queue", "[core][event_bus]") {
    EventBus bus;
    std::vector<int32_t> values;
    auto conn = bus.subscribe<ResourceChangedEvent>([&](const ResourceChangedEvent& e) {
        values.push_back(e.new_value);
    });

    bus.queue(resource_event(1));
    bus.queue(resource_event(2));
    REQUIRE(values.empty());
    REQUIRE(bus.has_queued_events());

    bus.flush();
    REQUIRE(values == std::vector<int32_t>{1, 2});
    REQUIRE_FALSE(bus.has_queued_events());
}

TEST_CASE("EventBus diagnostics history", "[core][event_bus]") {
    SECTION("Ring buffer keeps the most recent events") {
        EventBus bus(3);
        for (int32_t i = 1; i <= 5; ++i) {
            bus.dispatch(resource_event(i));
        }

        auto recent = bus.history();
        REQUIRE(recent.size() == 3);
        REQUIRE(recent.front().get_if<ResourceChangedEvent>()->new_value == 3);
        REQUIRE(recent.back().get_if<ResourceChangedEvent>()->new_value == 5);
    }

    SECTION("History filters by type and limit") {
        EventBus bus;
        bus.dispatch(resource_event(1));
        bus.dispatch(RewardGrantedEvent{"save", "journal", "base", "", false, "test"});
        bus.dispatch(resource_event(2));

        REQUIRE(bus.history(EventType::RewardGranted).size() == 1);
        auto last = bus.history(EventType::ResourceChanged, 1);
        REQUIRE(last.size() == 1);
        REQUIRE(last[0].get_if<ResourceChangedEvent>()->new_value == 2);
    }

    SECTION("Zero capacity disables history") {
        EventBus bus(0);
        bus.dispatch(resource_event(1));
        REQUIRE(bus.history().empty());
    }

    SECTION("Shrinking capacity trims oldest events") {
        EventBus bus;
        for (int32_t i = 1; i <= 4; ++i) {
            bus.dispatch(resource_event(i));
        }
        bus.set_history_capacity(2);
        REQUIRE(bus.history_capacity() == 2);

        auto recent = bus.history();
        REQUIRE(recent.size() == 2);
        REQUIRE(recent.front().get_if<ResourceChangedEvent>()->new_value == 3);

        bus.clear_history();
        REQUIRE(bus.history().empty());
    }
}
