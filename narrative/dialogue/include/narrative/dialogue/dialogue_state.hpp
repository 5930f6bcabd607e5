#pragma once

#include <narrative/dialogue/dialogue_context.hpp>
#include <narrative/economy/resource.hpp>
#include <narrative/core/settings.hpp>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstdint>

namespace narrative::dialogue {

using economy::ChoiceQuality;

// ============================================================================
// State Kind
// ============================================================================

enum class StateKind : uint8_t {
    Intro,
    Question,
    Response,
    Backstory,          // Side content; returns to the state that triggered it
    CriticalMoment,
    Conclusion,
    Transition
};

const char* to_string(StateKind kind);
std::optional<StateKind> state_kind_from_string(const std::string& str);

// ============================================================================
// Dialogue Condition
// ============================================================================

// All present clauses must hold. An empty condition is always true.
struct DialogueCondition {
    std::optional<int32_t> min_score;
    std::optional<int32_t> max_score;
    std::vector<std::string> requires_visited;
    std::vector<std::string> requires_options;
    bool negate = false;        // Invert result

    std::function<bool(const DialogueContext&)> custom_check;

    bool evaluate(const DialogueContext& context) const;    // Implemented in cpp
};

// ============================================================================
// Knowledge Gain
// ============================================================================

struct KnowledgeGain {
    std::string concept_id;
    std::string domain_id;
    int32_t amount = 0;
};

// ============================================================================
// Dialogue Option
// ============================================================================

struct DialogueOption {
    std::string id;
    std::string text;
    std::string next_state_id;      // Empty = continue with the state's own next

    std::optional<std::string> response_text;   // Shown before advancing

    int32_t insight_gain = 0;
    int32_t relationship_change = 0;
    std::optional<KnowledgeGain> knowledge_gain;

    bool triggers_backstory = false;    // next_state_id is a Backstory state
    bool is_critical_path = false;
    ChoiceQuality quality = ChoiceQuality::Auto;

    std::optional<DialogueCondition> condition;

    bool is_available(const DialogueContext& context) const {
        return !condition || condition->evaluate(context);
    }

    // Auto resolves from the sign of relationship_change
    ChoiceQuality resolved_quality() const;
};

// ============================================================================
// Conditional Next - tiered outcome branch
// ============================================================================

struct ConditionalNext {
    DialogueCondition condition;
    std::string state_id;
};

// ============================================================================
// Dialogue State
// ============================================================================

struct DialogueState {
    std::string id;
    StateKind kind = StateKind::Question;
    std::string text;

    std::vector<DialogueOption> options;

    // Auto-advance target; conditional branches are checked first, in order
    std::string next_state_id;
    std::vector<ConditionalNext> conditional_next;

    bool is_mandatory = false;
    bool is_critical_path = false;
    bool is_conclusion = false;

    std::optional<uint32_t> max_visits;     // Loop guard override

    // Helper methods
    bool has_options() const { return !options.empty(); }
    bool has_continuation() const { return !next_state_id.empty() || !conditional_next.empty(); }
    bool is_backstory() const { return kind == StateKind::Backstory; }
    bool is_terminal() const { return is_conclusion && !has_continuation() && !has_options(); }

    const DialogueOption* find_option(const std::string& option_id) const;

    // Explicit max_visits, else the settings default for the state's kind
    uint32_t effective_max_visits(const core::DialogueSettings& settings) const;
};

// ============================================================================
// Dialogue State Builder
// ============================================================================

class DialogueStateBuilder {
public:
    DialogueStateBuilder(const std::string& id) {
        m_state.id = id;
    }

    DialogueStateBuilder& kind(StateKind k) {
        m_state.kind = k;
        if (k == StateKind::Conclusion) {
            m_state.is_conclusion = true;
        }
        return *this;
    }

    DialogueStateBuilder& text(const std::string& t) {
        m_state.text = t;
        return *this;
    }

    DialogueStateBuilder& next(const std::string& state_id) {
        m_state.next_state_id = state_id;
        return *this;
    }

    DialogueStateBuilder& next_if(DialogueCondition condition, const std::string& state_id) {
        m_state.conditional_next.push_back({std::move(condition), state_id});
        return *this;
    }

    // Branch taken when the player score is at least min_score
    DialogueStateBuilder& next_if_score(int32_t min_score, const std::string& state_id) {
        DialogueCondition c;
        c.min_score = min_score;
        m_state.conditional_next.push_back({std::move(c), state_id});
        return *this;
    }

    DialogueStateBuilder& option(DialogueOption o) {
        m_state.options.push_back(std::move(o));
        return *this;
    }

    DialogueStateBuilder& option(const std::string& id, const std::string& text,
                                 const std::string& target) {
        DialogueOption o;
        o.id = id;
        o.text = text;
        o.next_state_id = target;
        m_state.options.push_back(std::move(o));
        return *this;
    }

    DialogueStateBuilder& mandatory(bool value = true) {
        m_state.is_mandatory = value;
        return *this;
    }

    DialogueStateBuilder& critical_path(bool value = true) {
        m_state.is_critical_path = value;
        return *this;
    }

    DialogueStateBuilder& conclusion(bool value = true) {
        m_state.is_conclusion = value;
        return *this;
    }

    DialogueStateBuilder& max_visits(uint32_t count) {
        m_state.max_visits = count;
        return *this;
    }

    DialogueState build() { return std::move(m_state); }

private:
    DialogueState m_state;
};

inline DialogueStateBuilder make_state(const std::string& id) {
    return DialogueStateBuilder(id);
}

// ============================================================================
// Dialogue Option Builder
// ============================================================================

class DialogueOptionBuilder {
public:
    DialogueOptionBuilder(const std::string& id) {
        m_option.id = id;
    }

    DialogueOptionBuilder& text(const std::string& t) {
        m_option.text = t;
        return *this;
    }

    DialogueOptionBuilder& next(const std::string& state_id) {
        m_option.next_state_id = state_id;
        return *this;
    }

    DialogueOptionBuilder& response(const std::string& t) {
        m_option.response_text = t;
        return *this;
    }

    DialogueOptionBuilder& insight(int32_t amount) {
        m_option.insight_gain = amount;
        return *this;
    }

    DialogueOptionBuilder& relationship(int32_t delta) {
        m_option.relationship_change = delta;
        return *this;
    }

    DialogueOptionBuilder& knowledge(const std::string& concept_id, const std::string& domain_id,
                                     int32_t amount) {
        m_option.knowledge_gain = KnowledgeGain{concept_id, domain_id, amount};
        return *this;
    }

    DialogueOptionBuilder& backstory(const std::string& state_id) {
        m_option.next_state_id = state_id;
        m_option.triggers_backstory = true;
        return *this;
    }

    DialogueOptionBuilder& critical_path(bool value = true) {
        m_option.is_critical_path = value;
        return *this;
    }

    DialogueOptionBuilder& quality(ChoiceQuality q) {
        m_option.quality = q;
        return *this;
    }

    DialogueOptionBuilder& condition(DialogueCondition c) {
        m_option.condition = std::move(c);
        return *this;
    }

    DialogueOptionBuilder& requires_score(int32_t min_score) {
        DialogueCondition c;
        c.min_score = min_score;
        m_option.condition = std::move(c);
        return *this;
    }

    DialogueOptionBuilder& requires_visited(const std::string& state_id) {
        if (!m_option.condition) m_option.condition = DialogueCondition{};
        m_option.condition->requires_visited.push_back(state_id);
        return *this;
    }

    DialogueOption build() { return std::move(m_option); }

private:
    DialogueOption m_option;
};

inline DialogueOptionBuilder make_option(const std::string& id) {
    return DialogueOptionBuilder(id);
}

} // namespace narrative::dialogue
