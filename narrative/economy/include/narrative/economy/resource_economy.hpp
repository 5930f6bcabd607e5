#pragma once

#include <narrative/economy/resource.hpp>
#include <narrative/economy/strategic_action.hpp>
#include <narrative/core/event_bus.hpp>
#include <narrative/core/settings.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace narrative::economy {

// ============================================================================
// ResourceEconomy - sole authority over player resources
//
// Every mutation clamps to [min, max] and reports through the bus:
// ResourceChanged when the clamped value moved, ThresholdCrossed once per
// crossing direction, MomentumReset when a streak breaks.
// ============================================================================

class ResourceEconomy {
public:
    static constexpr const char* INSIGHT = "insight";
    static constexpr const char* MOMENTUM = "momentum";

    explicit ResourceEconomy(core::EventBus& bus, core::EconomySettings settings = {});

    ResourceEconomy(const ResourceEconomy&) = delete;
    ResourceEconomy& operator=(const ResourceEconomy&) = delete;

    // ========================================================================
    // Resources
    // ========================================================================

    // Throws std::invalid_argument on duplicate id or min > max
    void register_resource(const std::string& id, int32_t initial, int32_t min, int32_t max);
    bool has_resource(const std::string& id) const;

    // Unknown ids throw std::out_of_range
    const Resource& get_resource(const std::string& id) const;
    int32_t value(const std::string& id) const;

    // Clamped add; returns the new value
    int32_t add_resource(const std::string& id, int32_t delta, const std::string& source = {});

    // Clamped set; returns the new value
    int32_t set_resource(const std::string& id, int32_t value, const std::string& source = {});

    int32_t insight() const { return value(INSIGHT); }
    int32_t momentum() const { return value(MOMENTUM); }

    // ========================================================================
    // Thresholds
    // ========================================================================

    void add_threshold(const std::string& resource_id, int32_t value,
                       const std::string& label, int32_t nearby_range = 0);
    std::vector<Threshold> get_thresholds(const std::string& resource_id) const;

    // ========================================================================
    // Momentum
    // ========================================================================

    // Optimal extends the streak, NonOptimal resets momentum to min.
    // Auto and Neutral leave momentum untouched.
    void record_choice(ChoiceQuality quality, const std::string& source = {});

    // Drop momentum to min and emit MomentumReset
    void reset_momentum(const std::string& source = {});

    uint32_t consecutive_optimal() const { return m_consecutive_optimal; }

    // Awards floor(base * multiplier * (1 + momentum * bonus)) insight.
    // Returns the amount actually applied after clamping.
    int32_t award_insight(int32_t base, double multiplier = 1.0, const std::string& source = {});

    // ========================================================================
    // Strategic actions
    // ========================================================================

    std::vector<StrategicAction> available_actions() const;
    bool can_activate(StrategicAction action) const;

    int32_t action_cost(StrategicAction action) const;
    int32_t momentum_required(StrategicAction action) const;

    // Spends the insight cost; only one action may be active at a time
    ActionResult activate_action(StrategicAction action, const std::string& character_id = {});

    // Resolves the active action. A failed boast breaks the streak.
    ActionResult complete_action(bool successful);

    // Abandons the active action and refunds its insight cost
    ActionResult cancel_action();

    std::optional<StrategicAction> active_action() const { return m_active_action; }

    // 0 outside the approach band, rising to 1 once the cost is affordable
    float threshold_proximity(StrategicAction action) const;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Restore initial values without emitting events
    void reset();

    const core::EconomySettings& settings() const { return m_settings; }

private:
    Resource& find_resource(const std::string& id);
    const Resource& find_resource(const std::string& id) const;

    int32_t apply(Resource& resource, int32_t target, const std::string& source);
    void check_thresholds(const std::string& resource_id, int32_t old_value, int32_t new_value);

    core::EventBus& m_bus;
    core::EconomySettings m_settings;

    std::map<std::string, Resource> m_resources;
    std::vector<Threshold> m_thresholds;

    uint32_t m_consecutive_optimal = 0;
    std::optional<StrategicAction> m_active_action;
    int32_t m_active_cost = 0;
    std::string m_active_character;
};

} // namespace narrative::economy
