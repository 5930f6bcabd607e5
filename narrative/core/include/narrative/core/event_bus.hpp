#pragma once

#include <narrative/core/events.hpp>
#include <array>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace narrative::core {

// ============================================================================
// ScopedConnection - RAII handle for event subscriptions
// ============================================================================

class ScopedConnection {
public:
    ScopedConnection() = default;

    explicit ScopedConnection(std::function<void()> disconnect_fn)
        : m_disconnect(std::move(disconnect_fn)) {}

    ~ScopedConnection() {
        disconnect();
    }

    // Non-copyable
    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    // Movable
    ScopedConnection(ScopedConnection&& other) noexcept
        : m_disconnect(std::move(other.m_disconnect)) {
        other.m_disconnect = nullptr;
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_disconnect = std::move(other.m_disconnect);
            other.m_disconnect = nullptr;
        }
        return *this;
    }

    void disconnect() {
        if (m_disconnect) {
            m_disconnect();
            m_disconnect = nullptr;
        }
    }

    bool connected() const {
        return m_disconnect != nullptr;
    }

    // Release ownership without disconnecting
    void release() {
        m_disconnect = nullptr;
    }

private:
    std::function<void()> m_disconnect;
};

// ============================================================================
// EventBus - typed publish/subscribe over the closed EventType set
// ============================================================================

class EventBus {
public:
    using Handler = std::function<void(const Event&)>;

    static constexpr size_t DEFAULT_HISTORY_CAPACITY = 256;

    explicit EventBus(size_t history_capacity = DEFAULT_HISTORY_CAPACITY);
    ~EventBus();

    // Non-copyable, non-movable: connections refer back to this instance
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    // ========================================================================
    // Subscription
    // ========================================================================

    // Subscribe to the channel of payload type T.
    // Returns a ScopedConnection that auto-unsubscribes on destruction.
    template<typename T>
    ScopedConnection subscribe(std::function<void(const T&)> callback) {
        static_assert(std::is_constructible_v<EventPayload, T>, "T must be an event payload");

        return subscribe(T::type, [cb = std::move(callback)](const Event& event) {
            if (const T* payload = event.get_if<T>()) {
                cb(*payload);
            }
        });
    }

    // Subscribe to a channel and receive the full Event record
    ScopedConnection subscribe(EventType type, Handler handler);

    // ========================================================================
    // Immediate Dispatch
    // ========================================================================

    // Calls all handlers of T's channel synchronously, in subscription order.
    // A handler that throws is isolated and reported; re-entering dispatch for
    // the channel currently being handled throws ReentrantDispatchError.
    template<typename T>
    void dispatch(T payload, std::string source = {}) {
        static_assert(std::is_constructible_v<EventPayload, T>, "T must be an event payload");
        dispatch_event(make_event(EventPayload(std::move(payload)), std::move(source)));
    }

    void dispatch_event(Event event);

    bool is_dispatching(EventType type) const;

    // ========================================================================
    // Deferred Dispatch (Queue)
    // ========================================================================

    // Queue an event for dispatch on the next flush(). Handlers that need to
    // answer with an event of their own channel use this instead of dispatch;
    // ProgressionGuard does so for follow-up RewardGranted events.
    template<typename T>
    void queue(T payload, std::string source = {}) {
        static_assert(std::is_constructible_v<EventPayload, T>, "T must be an event payload");
        Event event = make_event(EventPayload(std::move(payload)), std::move(source));

        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_queued_events.push_back(std::move(event));
    }

    // Dispatch everything queued so far. Events queued during the flush
    // are kept for the next one.
    void flush();

    bool has_queued_events() const;

    // ========================================================================
    // Utility
    // ========================================================================

    size_t handler_count(EventType type) const;

    // Number of handler invocations that threw since construction
    size_t handler_failure_count() const { return m_handler_failures.load(); }

    // ========================================================================
    // Diagnostics history (bounded ring buffer)
    // ========================================================================

    // Most recent events, oldest first. `type` filters by channel.
    std::vector<Event> history(std::optional<EventType> type = std::nullopt,
                               size_t limit = DEFAULT_HISTORY_CAPACITY) const;
    void clear_history();

    size_t history_capacity() const;
    void set_history_capacity(size_t capacity);

private:
    struct HandlerEntry {
        uint64_t id;
        Handler callback;
    };

    Event make_event(EventPayload payload, std::string source);
    void unsubscribe(EventType type, uint64_t handler_id);
    void record(const Event& event);
    void report_handler_failure(const Event& event, const std::string& what);

    static size_t index_of(EventType type) { return static_cast<size_t>(type); }

    mutable std::mutex m_handlers_mutex;
    std::array<std::vector<HandlerEntry>, EVENT_TYPE_COUNT> m_handlers;
    std::array<bool, EVENT_TYPE_COUNT> m_dispatching{};

    mutable std::mutex m_queue_mutex;
    std::vector<Event> m_queued_events;

    mutable std::mutex m_history_mutex;
    std::deque<Event> m_history;
    size_t m_history_capacity;

    std::atomic<uint64_t> m_next_handler_id{1};
    std::atomic<uint64_t> m_next_sequence{1};
    std::atomic<size_t> m_handler_failures{0};

    // Connections outliving the bus check this before unsubscribing
    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};

} // namespace narrative::core
