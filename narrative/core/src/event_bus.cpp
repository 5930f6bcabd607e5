#include <narrative/core/event_bus.hpp>
#include <narrative/core/errors.hpp>
#include <narrative/core/log.hpp>
#include <algorithm>
#include <chrono>

namespace narrative::core {

namespace {

// Marks a channel as in-flight for the lifetime of one dispatch
class DispatchScope {
public:
    explicit DispatchScope(bool& flag) : m_flag(flag) { m_flag = true; }
    ~DispatchScope() { m_flag = false; }

    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

private:
    bool& m_flag;
};

uint64_t now_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

EventBus::EventBus(size_t history_capacity)
    : m_history_capacity(history_capacity) {
}

EventBus::~EventBus() = default;

// ============================================================================
// Subscription
// ============================================================================

ScopedConnection EventBus::subscribe(EventType type, Handler handler) {
    uint64_t handler_id = m_next_handler_id++;

    {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        m_handlers[index_of(type)].push_back({handler_id, std::move(handler)});
    }

    std::weak_ptr<bool> alive = m_alive;
    return ScopedConnection([this, alive, type, handler_id]() {
        if (alive.expired()) return;
        unsubscribe(type, handler_id);
    });
}

void EventBus::unsubscribe(EventType type, uint64_t handler_id) {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    auto& handlers = m_handlers[index_of(type)];
    handlers.erase(
        std::remove_if(handlers.begin(), handlers.end(),
            [handler_id](const HandlerEntry& h) { return h.id == handler_id; }),
        handlers.end()
    );
}

// ============================================================================
// Dispatch
// ============================================================================

Event EventBus::make_event(EventPayload payload, std::string source) {
    Event event;
    event.type = type_of(payload);
    event.payload = std::move(payload);
    event.timestamp = now_ms();
    event.source = source.empty() ? "unknown" : std::move(source);
    event.sequence = m_next_sequence++;
    return event;
}

void EventBus::dispatch_event(Event event) {
    const size_t idx = index_of(event.type);

    if (m_dispatching[idx]) {
        log(LogLevel::Error, std::string("[EventBus] Re-entrant dispatch of ") +
            to_string(event.type) + " from '" + event.source + "'");

        if (event.type != EventType::Error && !m_dispatching[index_of(EventType::Error)]) {
            dispatch(ErrorEvent{"reentrant_dispatch",
                                std::string("Re-entrant dispatch of ") + to_string(event.type),
                                "event_bus", event.source}, "event_bus");
        }
        throw ReentrantDispatchError(event.type);
    }

    record(event);

    // Snapshot so handlers may subscribe/unsubscribe while being called
    std::vector<HandlerEntry> handlers_copy;
    {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        handlers_copy = m_handlers[idx];
    }

    DispatchScope scope(m_dispatching[idx]);

    for (const auto& handler : handlers_copy) {
        try {
            handler.callback(event);
        } catch (const ReentrantDispatchError&) {
            // Wiring fault: never absorbed by fault isolation
            throw;
        } catch (const std::exception& e) {
            report_handler_failure(event, e.what());
        }
    }
}

bool EventBus::is_dispatching(EventType type) const {
    return m_dispatching[index_of(type)];
}

void EventBus::report_handler_failure(const Event& event, const std::string& what) {
    m_handler_failures++;

    log(LogLevel::Error, std::string("[EventBus] Handler for ") + to_string(event.type) +
        " (source '" + event.source + "') threw: " + what);

    // Diagnostic channel; a failing error handler is only logged
    if (event.type != EventType::Error && !m_dispatching[index_of(EventType::Error)]) {
        dispatch(ErrorEvent{"handler_failure", what, "event_bus", to_string(event.type)},
                 "event_bus");
    }
}

// ============================================================================
// Deferred Dispatch
// ============================================================================

void EventBus::flush() {
    // Swap queued events to local vector to minimize lock time
    std::vector<Event> events_to_dispatch;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        events_to_dispatch = std::move(m_queued_events);
        m_queued_events.clear();
    }

    for (auto& queued : events_to_dispatch) {
        dispatch_event(std::move(queued));
    }
}

bool EventBus::has_queued_events() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return !m_queued_events.empty();
}

// ============================================================================
// Utility
// ============================================================================

size_t EventBus::handler_count(EventType type) const {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    return m_handlers[index_of(type)].size();
}

// ============================================================================
// History
// ============================================================================

void EventBus::record(const Event& event) {
    std::lock_guard<std::mutex> lock(m_history_mutex);
    if (m_history_capacity == 0) return;

    m_history.push_back(event);
    while (m_history.size() > m_history_capacity) {
        m_history.pop_front();
    }
}

std::vector<Event> EventBus::history(std::optional<EventType> type, size_t limit) const {
    std::lock_guard<std::mutex> lock(m_history_mutex);

    std::vector<Event> result;
    for (auto it = m_history.rbegin(); it != m_history.rend() && result.size() < limit; ++it) {
        if (!type || it->type == *type) {
            result.push_back(*it);
        }
    }
    std::reverse(result.begin(), result.end());
    return result;
}

void EventBus::clear_history() {
    std::lock_guard<std::mutex> lock(m_history_mutex);
    m_history.clear();
}

size_t EventBus::history_capacity() const {
    std::lock_guard<std::mutex> lock(m_history_mutex);
    return m_history_capacity;
}

void EventBus::set_history_capacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(m_history_mutex);
    m_history_capacity = capacity;
    while (m_history.size() > m_history_capacity) {
        m_history.pop_front();
    }
}

} // namespace narrative::core
