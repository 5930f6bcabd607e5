#include <narrative/economy/resource_economy.hpp>
#include <narrative/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace narrative::economy {

using core::log;
using core::LogLevel;

namespace {

constexpr const char* SOURCE = "economy";

const std::string& or_default(const std::string& source) {
    static const std::string fallback = SOURCE;
    return source.empty() ? fallback : source;
}

} // namespace

ResourceEconomy::ResourceEconomy(core::EventBus& bus, core::EconomySettings settings)
    : m_bus(bus)
    , m_settings(settings) {
    register_resource(INSIGHT, m_settings.insight_min, m_settings.insight_min, m_settings.insight_max);
    register_resource(MOMENTUM, m_settings.momentum_min, m_settings.momentum_min, m_settings.momentum_max);

    // Action-unlock boundaries
    add_threshold(INSIGHT, m_settings.reframe_cost, to_string(StrategicAction::Reframe), 10);
    add_threshold(INSIGHT, m_settings.extrapolate_cost, to_string(StrategicAction::Extrapolate), 15);
    add_threshold(INSIGHT, m_settings.synthesis_cost, to_string(StrategicAction::Synthesis), 20);
    add_threshold(MOMENTUM, m_settings.momentum_max, to_string(StrategicAction::Boast));
}

// ============================================================================
// Resources
// ============================================================================

void ResourceEconomy::register_resource(const std::string& id, int32_t initial,
                                        int32_t min, int32_t max) {
    if (min > max) {
        throw std::invalid_argument("Resource '" + id + "' has min greater than max");
    }
    if (m_resources.count(id)) {
        throw std::invalid_argument("Resource '" + id + "' is already registered");
    }

    Resource resource;
    resource.id = id;
    resource.min = min;
    resource.max = max;
    resource.initial = std::clamp(initial, min, max);
    resource.value = resource.initial;
    m_resources.emplace(id, resource);
}

bool ResourceEconomy::has_resource(const std::string& id) const {
    return m_resources.count(id) > 0;
}

Resource& ResourceEconomy::find_resource(const std::string& id) {
    auto it = m_resources.find(id);
    if (it == m_resources.end()) {
        throw std::out_of_range("Unknown resource '" + id + "'");
    }
    return it->second;
}

const Resource& ResourceEconomy::find_resource(const std::string& id) const {
    auto it = m_resources.find(id);
    if (it == m_resources.end()) {
        throw std::out_of_range("Unknown resource '" + id + "'");
    }
    return it->second;
}

const Resource& ResourceEconomy::get_resource(const std::string& id) const {
    return find_resource(id);
}

int32_t ResourceEconomy::value(const std::string& id) const {
    return find_resource(id).value;
}

int32_t ResourceEconomy::add_resource(const std::string& id, int32_t delta, const std::string& source) {
    Resource& resource = find_resource(id);
    int64_t target = static_cast<int64_t>(resource.value) + delta;
    target = std::clamp<int64_t>(target, resource.min, resource.max);
    return apply(resource, static_cast<int32_t>(target), source);
}

int32_t ResourceEconomy::set_resource(const std::string& id, int32_t value, const std::string& source) {
    Resource& resource = find_resource(id);
    return apply(resource, std::clamp(value, resource.min, resource.max), source);
}

int32_t ResourceEconomy::apply(Resource& resource, int32_t target, const std::string& source) {
    int32_t old_value = resource.value;
    if (target == old_value) {
        return old_value;
    }

    resource.value = target;

    log(LogLevel::Debug, "[Economy] " + resource.id + " " + std::to_string(old_value) +
        " -> " + std::to_string(target) + " (" + or_default(source) + ")");

    core::ResourceChangedEvent event;
    event.resource_id = resource.id;
    event.previous_value = old_value;
    event.new_value = target;
    event.delta = target - old_value;
    event.min_value = resource.min;
    event.max_value = resource.max;
    event.source = or_default(source);
    m_bus.dispatch(event, SOURCE);

    check_thresholds(resource.id, old_value, target);
    return target;
}

// ============================================================================
// Thresholds
// ============================================================================

void ResourceEconomy::add_threshold(const std::string& resource_id, int32_t value,
                                    const std::string& label, int32_t nearby_range) {
    find_resource(resource_id);  // Validates the id

    Threshold threshold;
    threshold.resource_id = resource_id;
    threshold.value = value;
    threshold.label = label;
    threshold.nearby_range = std::max(0, nearby_range);
    m_thresholds.push_back(threshold);
}

std::vector<Threshold> ResourceEconomy::get_thresholds(const std::string& resource_id) const {
    std::vector<Threshold> result;
    for (const auto& threshold : m_thresholds) {
        if (threshold.resource_id == resource_id) {
            result.push_back(threshold);
        }
    }
    return result;
}

void ResourceEconomy::check_thresholds(const std::string& resource_id, int32_t old_value, int32_t new_value) {
    for (const auto& threshold : m_thresholds) {
        if (threshold.resource_id != resource_id) continue;

        bool was_above = old_value >= threshold.value;
        bool is_above = new_value >= threshold.value;
        if (was_above == is_above) continue;

        core::ThresholdCrossedEvent event;
        event.resource_id = resource_id;
        event.label = threshold.label;
        event.threshold = threshold.value;
        event.value = new_value;
        event.direction = is_above ? core::CrossingDirection::Up : core::CrossingDirection::Down;
        m_bus.dispatch(event, SOURCE);
    }
}

// ============================================================================
// Momentum
// ============================================================================

void ResourceEconomy::record_choice(ChoiceQuality quality, const std::string& source) {
    switch (quality) {
        case ChoiceQuality::Optimal:
            m_consecutive_optimal++;
            add_resource(MOMENTUM, 1, source);
            break;
        case ChoiceQuality::NonOptimal:
            reset_momentum(source);
            break;
        case ChoiceQuality::Auto:
        case ChoiceQuality::Neutral:
            break;
    }
}

void ResourceEconomy::reset_momentum(const std::string& source) {
    Resource& momentum = find_resource(MOMENTUM);
    int32_t old_value = momentum.value;
    uint32_t streak = m_consecutive_optimal;

    // No streak and nothing to lose
    if (old_value == momentum.min && streak == 0) {
        return;
    }

    momentum.value = momentum.min;
    m_consecutive_optimal = 0;

    log(LogLevel::Debug, "[Economy] Momentum streak broken at " + std::to_string(old_value) +
        " (" + or_default(source) + ")");

    // Distinct from ResourceChanged: listeners give "broken streak" feedback
    core::MomentumResetEvent event;
    event.previous_value = old_value;
    event.new_value = momentum.min;
    event.streak_lost = streak;
    event.source = or_default(source);
    m_bus.dispatch(event, SOURCE);

    check_thresholds(MOMENTUM, old_value, momentum.min);
}

int32_t ResourceEconomy::award_insight(int32_t base, double multiplier, const std::string& source) {
    if (base == 0) return 0;

    double bonus = 1.0 + static_cast<double>(momentum()) * m_settings.momentum_insight_bonus;
    auto amount = static_cast<int32_t>(std::floor(static_cast<double>(base) * multiplier * bonus));

    int32_t before = insight();
    int32_t after = add_resource(INSIGHT, amount, source);
    return after - before;
}

// ============================================================================
// Strategic actions
// ============================================================================

int32_t ResourceEconomy::action_cost(StrategicAction action) const {
    switch (action) {
        case StrategicAction::Reframe:     return m_settings.reframe_cost;
        case StrategicAction::Extrapolate: return m_settings.extrapolate_cost;
        case StrategicAction::Synthesis:   return m_settings.synthesis_cost;
        case StrategicAction::Boast:       return 0;
    }
    return 0;
}

int32_t ResourceEconomy::momentum_required(StrategicAction action) const {
    switch (action) {
        case StrategicAction::Extrapolate: return m_settings.extrapolate_momentum;
        case StrategicAction::Boast:       return m_settings.momentum_max;
        case StrategicAction::Reframe:
        case StrategicAction::Synthesis:   return 0;
    }
    return 0;
}

bool ResourceEconomy::can_activate(StrategicAction action) const {
    if (m_active_action) return false;
    return insight() >= action_cost(action) && momentum() >= momentum_required(action);
}

std::vector<StrategicAction> ResourceEconomy::available_actions() const {
    std::vector<StrategicAction> result;
    for (StrategicAction action : ALL_STRATEGIC_ACTIONS) {
        if (can_activate(action)) {
            result.push_back(action);
        }
    }
    return result;
}

ActionResult ResourceEconomy::activate_action(StrategicAction action, const std::string& character_id) {
    ActionResult result;
    result.action = action;

    if (m_active_action) {
        result.error = std::string("Action '") + to_string(*m_active_action) + "' is already active";
        log(LogLevel::Warn, "[Economy] Cannot activate " + std::string(to_string(action)) + ": " + result.error);
        return result;
    }

    if (!can_activate(action)) {
        result.error = "Not available (insight " + std::to_string(insight()) +
                       ", momentum " + std::to_string(momentum()) + ")";
        log(LogLevel::Warn, "[Economy] Cannot activate " + std::string(to_string(action)) + ": " + result.error);
        return result;
    }

    int32_t cost = action_cost(action);
    if (cost > 0) {
        add_resource(INSIGHT, -cost, "strategic_action");
    }

    m_active_action = action;
    m_active_cost = cost;
    m_active_character = character_id;

    result.success = true;
    result.insight_spent = cost;

    core::StrategicActionEvent event;
    event.action = to_string(action);
    event.phase = "activated";
    event.insight_cost = cost;
    event.character_id = character_id;
    m_bus.dispatch(event, SOURCE);

    return result;
}

ActionResult ResourceEconomy::complete_action(bool successful) {
    ActionResult result;

    if (!m_active_action) {
        result.error = "No action is active";
        log(LogLevel::Warn, "[Economy] Cannot complete: no action is active");
        return result;
    }

    StrategicAction action = *m_active_action;
    result.action = action;
    result.success = true;
    result.insight_spent = m_active_cost;

    std::string character = m_active_character;
    m_active_action.reset();
    m_active_cost = 0;
    m_active_character.clear();

    if (action == StrategicAction::Boast && !successful) {
        reset_momentum(to_string(StrategicAction::Boast));
    }

    core::StrategicActionEvent event;
    event.action = to_string(action);
    event.phase = "completed";
    event.insight_cost = result.insight_spent;
    event.successful = successful;
    event.character_id = character;
    m_bus.dispatch(event, SOURCE);

    return result;
}

ActionResult ResourceEconomy::cancel_action() {
    ActionResult result;

    if (!m_active_action) {
        result.error = "No action is active";
        log(LogLevel::Warn, "[Economy] Cannot cancel: no action is active");
        return result;
    }

    StrategicAction action = *m_active_action;
    int32_t refund = m_active_cost;
    std::string character = m_active_character;

    m_active_action.reset();
    m_active_cost = 0;
    m_active_character.clear();

    if (refund > 0) {
        add_resource(INSIGHT, refund, "strategic_action");
    }

    result.action = action;
    result.success = true;
    result.insight_refunded = refund;

    core::StrategicActionEvent event;
    event.action = to_string(action);
    event.phase = "cancelled";
    event.insight_refunded = refund;
    event.character_id = character;
    m_bus.dispatch(event, SOURCE);

    return result;
}

float ResourceEconomy::threshold_proximity(StrategicAction action) const {
    if (action == StrategicAction::Boast) {
        return find_resource(MOMENTUM).get_percent();
    }

    int32_t cost = action_cost(action);
    if (cost <= 0) return 0.0f;

    int32_t current = insight();
    if (current >= cost) return 1.0f;

    auto it = std::find_if(m_thresholds.begin(), m_thresholds.end(), [&](const Threshold& t) {
        return t.resource_id == INSIGHT && t.label == to_string(action);
    });
    if (it == m_thresholds.end() || it->nearby_range <= 0) return 0.0f;

    int32_t start = cost - it->nearby_range;
    if (current < start) return 0.0f;
    return static_cast<float>(current - start) / static_cast<float>(it->nearby_range);
}

// ============================================================================
// Lifecycle
// ============================================================================

void ResourceEconomy::reset() {
    for (auto& [id, resource] : m_resources) {
        resource.value = resource.initial;
    }
    m_consecutive_optimal = 0;
    m_active_action.reset();
    m_active_cost = 0;
    m_active_character.clear();
}

} // namespace narrative::economy
