#pragma once

#include <narrative/progression/critical_reward.hpp>
#include <narrative/progression/reward_store.hpp>
#include <narrative/progression/retry_policy.hpp>
#include <narrative/core/errors.hpp>
#include <narrative/core/event_bus.hpp>
#include <narrative/core/scheduler.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace narrative::progression {

// ============================================================================
// Grant results
// ============================================================================

enum class GrantOutcome : uint8_t {
    Granted,            // First grant persisted
    Upgraded,           // Higher tier replaced the stored one
    AlreadyGranted,     // Equal or lower tier; nothing changed
    RetryScheduled,     // Write failed; a retry is pending
    Failed              // Retries exhausted; record left ungranted
};

const char* to_string(GrantOutcome outcome);

struct GrantResult {
    GrantOutcome outcome = GrantOutcome::AlreadyGranted;
    std::string reward_id;
    RewardTier tier = RewardTier::Base;                 // Stored tier, or the requested one if not granted
    std::optional<RewardTier> previous_tier;            // Set on upgrade and no-op
    uint32_t attempts = 0;                              // Writes made by this grant
    std::optional<core::CriticalRewardFailure> failure;

    bool granted() const {
        return outcome == GrantOutcome::Granted || outcome == GrantOutcome::Upgraded ||
               outcome == GrantOutcome::AlreadyGranted;
    }
};

// Grants `reward_id` whenever CriticalPathReached names `trigger_state_id`
struct RewardRule {
    std::string reward_id;
    std::string trigger_state_id;
    std::string graph_id;                               // Empty matches any graph
    RewardTier tier = RewardTier::Base;

    // Overrides `tier` when set
    std::function<RewardTier(const core::CriticalPathReachedEvent&)> select_tier;
};

// ============================================================================
// ProgressionGuard - single authority for critical reward grants
//
// Every call site issues grant(reward, tier). Per (save, reward) exactly one
// granted record exists; later calls upgrade it or do nothing. A record is
// marked granted only after the store accepted the write.
// ============================================================================

class ProgressionGuard {
public:
    using CompletionCallback = std::function<void(const GrantResult&)>;

    ProgressionGuard(std::string save_id,
                     IRewardStore& store,
                     core::EventBus& bus,
                     core::IScheduler& scheduler,
                     RetryPolicy policy = {});
    ~ProgressionGuard();

    ProgressionGuard(const ProgressionGuard&) = delete;
    ProgressionGuard& operator=(const ProgressionGuard&) = delete;

    // Returns RetryScheduled when the write failed and a retry is pending;
    // `on_complete` then receives the final result from the retry. Throws
    // CriticalRewardFailure when the policy allows no retries and the write
    // failed.
    GrantResult grant(const std::string& reward_id,
                      RewardTier tier,
                      const std::string& source,
                      CompletionCallback on_complete = nullptr);

    void add_rule(RewardRule rule);
    size_t rule_count() const { return m_rules.size(); }

    bool is_granted(const std::string& reward_id) const;
    std::optional<CriticalReward> get_reward(const std::string& reward_id) const;

    size_t pending_retry_count() const { return m_pending_retries.size(); }
    void cancel_retries();

    const std::string& save_id() const { return m_save_id; }
    const RetryPolicy& policy() const { return m_policy; }

private:
    struct PendingRetry {
        core::TimerHandle handle;
        std::string reward_id;
    };

    GrantResult attempt(const std::string& reward_id, RewardTier tier,
                        const std::string& source, uint32_t attempt_number,
                        const CompletionCallback& on_complete);
    void schedule_retry(const std::string& reward_id, RewardTier tier, const std::string& source,
                        uint32_t attempt_number, CompletionCallback on_complete);
    void report_failure(const core::CriticalRewardFailure& failure);

    // Dispatches RewardGranted, or queues it when called from a handler of
    // that channel; the outermost announcement flushes the queue
    void announce(core::RewardGrantedEvent event);

    CriticalReward& record_for(const std::string& reward_id);
    void on_critical_path(const core::CriticalPathReachedEvent& event);

    std::string m_save_id;
    IRewardStore& m_store;
    core::EventBus& m_bus;
    core::IScheduler& m_scheduler;
    RetryPolicy m_policy;

    std::map<std::string, CriticalReward> m_records;

    uint64_t m_next_retry_id = 1;
    std::map<uint64_t, PendingRetry> m_pending_retries;

    std::vector<RewardRule> m_rules;
    core::ScopedConnection m_rule_connection;
};

} // namespace narrative::progression
