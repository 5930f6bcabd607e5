#pragma once

#include <narrative/core/events.hpp>
#include <stdexcept>
#include <string>
#include <cstdint>

namespace narrative::core {

// ============================================================================
// Error taxonomy
// ============================================================================

// Base for every error raised by the engine. `category()` matches the
// ErrorEvent category dispatched before the error is thrown.
class NarrativeError : public std::runtime_error {
public:
    explicit NarrativeError(const std::string& message)
        : std::runtime_error(message) {}

    virtual const char* category() const noexcept = 0;
};

// Malformed or missing state reference. Authoring fault; should not occur
// against a validated graph.
class GraphError : public NarrativeError {
public:
    explicit GraphError(const std::string& message)
        : NarrativeError(message) {}

    const char* category() const noexcept override { return "graph_error"; }
};

// Caller selected an option that is not valid in the current context.
// Recoverable: re-prompt.
class InvalidOptionError : public NarrativeError {
public:
    InvalidOptionError(const std::string& option_id, const std::string& message)
        : NarrativeError(message), m_option_id(option_id) {}

    const char* category() const noexcept override { return "invalid_option"; }
    const std::string& option_id() const { return m_option_id; }

private:
    std::string m_option_id;
};

// Visit budget of a state exceeded. Fatal for the session's normal flow;
// the owner falls back to forced repair.
class LoopDetectedError : public NarrativeError {
public:
    LoopDetectedError(const std::string& state_id, uint32_t visits, uint32_t max_visits)
        : NarrativeError("Loop detected at state '" + state_id + "' (" +
                         std::to_string(visits) + " visits, max " +
                         std::to_string(max_visits) + ")")
        , m_state_id(state_id)
        , m_visits(visits)
        , m_max_visits(max_visits) {}

    const char* category() const noexcept override { return "loop_detected"; }
    const std::string& state_id() const { return m_state_id; }
    uint32_t visits() const { return m_visits; }
    uint32_t max_visits() const { return m_max_visits; }

private:
    std::string m_state_id;
    uint32_t m_visits;
    uint32_t m_max_visits;
};

// Persistence write for a critical reward failed after all retries.
// The reward stays ungranted so another call site may still succeed.
class CriticalRewardFailure : public NarrativeError {
public:
    CriticalRewardFailure(const std::string& reward_id, uint32_t attempts)
        : NarrativeError("Critical reward '" + reward_id + "' could not be persisted after " +
                         std::to_string(attempts) + " attempt(s)")
        , m_reward_id(reward_id)
        , m_attempts(attempts) {}

    const char* category() const noexcept override { return "critical_reward_failure"; }
    const std::string& reward_id() const { return m_reward_id; }
    uint32_t attempts() const { return m_attempts; }

private:
    std::string m_reward_id;
    uint32_t m_attempts;
};

// A handler re-entered dispatch for the event type it is handling.
class ReentrantDispatchError : public NarrativeError {
public:
    explicit ReentrantDispatchError(EventType type)
        : NarrativeError(std::string("Re-entrant dispatch of ") + to_string(type))
        , m_type(type) {}

    const char* category() const noexcept override { return "reentrant_dispatch"; }
    EventType event_type() const { return m_type; }

private:
    EventType m_type;
};

} // namespace narrative::core
