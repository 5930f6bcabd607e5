#include <narrative/progression/progression_guard.hpp>
#include <narrative/core/log.hpp>
#include <utility>

namespace narrative::progression {

using core::log;
using core::LogLevel;

namespace {

constexpr const char* SOURCE = "progression_guard";

std::string delay_text(float seconds) {
    return std::to_string(static_cast<int>(seconds * 1000.0f)) + "ms";
}

} // namespace

const char* to_string(GrantOutcome outcome) {
    switch (outcome) {
        case GrantOutcome::Granted:        return "granted";
        case GrantOutcome::Upgraded:       return "upgraded";
        case GrantOutcome::AlreadyGranted: return "already_granted";
        case GrantOutcome::RetryScheduled: return "retry_scheduled";
        case GrantOutcome::Failed:         return "failed";
    }
    return "failed";
}

ProgressionGuard::ProgressionGuard(std::string save_id,
                                   IRewardStore& store,
                                   core::EventBus& bus,
                                   core::IScheduler& scheduler,
                                   RetryPolicy policy)
    : m_save_id(std::move(save_id))
    , m_store(store)
    , m_bus(bus)
    , m_scheduler(scheduler)
    , m_policy(policy) {
    if (m_policy.max_attempts == 0) {
        m_policy.max_attempts = 1;
    }
}

ProgressionGuard::~ProgressionGuard() {
    cancel_retries();
}

// ============================================================================
// Grant
// ============================================================================

GrantResult ProgressionGuard::grant(const std::string& reward_id,
                                    RewardTier tier,
                                    const std::string& source,
                                    CompletionCallback on_complete) {
    GrantResult result = attempt(reward_id, tier, source, 1, on_complete);

    if (result.outcome == GrantOutcome::Failed) {
        throw *result.failure;
    }
    if (result.outcome != GrantOutcome::RetryScheduled && on_complete) {
        on_complete(result);
    }
    return result;
}

GrantResult ProgressionGuard::attempt(const std::string& reward_id, RewardTier tier,
                                      const std::string& source, uint32_t attempt_number,
                                      const CompletionCallback& on_complete) {
    CriticalReward& record = record_for(reward_id);

    GrantResult result;
    result.reward_id = reward_id;
    result.tier = tier;

    // Equal or lower tier never rewrites the record
    if (record.granted && tier <= record.granted_tier) {
        result.outcome = GrantOutcome::AlreadyGranted;
        result.tier = record.granted_tier;
        result.previous_tier = record.granted_tier;
        log(LogLevel::Debug, "[ProgressionGuard] '" + reward_id + "' already granted at " +
            to_string(record.granted_tier) + " (requested " + to_string(tier) + " by " + source + ")");
        return result;
    }

    CriticalReward candidate = record;
    candidate.granted = true;
    candidate.granted_tier = tier;
    candidate.attempts = record.attempts + 1;

    record.attempts = candidate.attempts;
    result.attempts = attempt_number;

    if (m_store.write(m_save_id, candidate)) {
        std::optional<RewardTier> previous;
        if (record.granted) {
            previous = record.granted_tier;
        }
        record = candidate;

        result.outcome = previous ? GrantOutcome::Upgraded : GrantOutcome::Granted;
        result.previous_tier = previous;

        core::RewardGrantedEvent event;
        event.save_id = m_save_id;
        event.reward_id = reward_id;
        event.tier = to_string(tier);
        event.previous_tier = previous ? to_string(*previous) : "";
        event.upgrade = previous.has_value();
        event.source = source;
        announce(std::move(event));

        log(LogLevel::Info, "[ProgressionGuard] '" + reward_id + "' " + to_string(result.outcome) +
            " at " + to_string(tier) + " by " + source);
        return result;
    }

    log(LogLevel::Warn, "[ProgressionGuard] Write for '" + reward_id + "' failed (attempt " +
        std::to_string(attempt_number) + "/" + std::to_string(m_policy.max_attempts) + ")");

    if (m_policy.allows_retry_after(attempt_number)) {
        schedule_retry(reward_id, tier, source, attempt_number, on_complete);
        result.outcome = GrantOutcome::RetryScheduled;
        return result;
    }

    core::CriticalRewardFailure failure(reward_id, attempt_number);
    report_failure(failure);

    result.outcome = GrantOutcome::Failed;
    result.failure = failure;
    return result;
}

void ProgressionGuard::schedule_retry(const std::string& reward_id, RewardTier tier,
                                      const std::string& source, uint32_t attempt_number,
                                      CompletionCallback on_complete) {
    float delay = m_policy.delay_for(attempt_number);
    uint64_t retry_id = m_next_retry_id++;
    m_pending_retries[retry_id] = PendingRetry{core::TimerHandle{}, reward_id};

    log(LogLevel::Info, "[ProgressionGuard] Retrying '" + reward_id + "' in " + delay_text(delay));

    core::TimerHandle handle = m_scheduler.schedule(delay,
        [this, retry_id, reward_id, tier, source, attempt_number, on_complete]() {
            m_pending_retries.erase(retry_id);

            // The record may have been granted by another call site meanwhile
            GrantResult result = attempt(reward_id, tier, source, attempt_number + 1, on_complete);
            if (result.outcome != GrantOutcome::RetryScheduled && on_complete) {
                on_complete(result);
            }
        });

    auto it = m_pending_retries.find(retry_id);
    if (it != m_pending_retries.end()) {
        it->second.handle = handle;
    }
}

void ProgressionGuard::cancel_retries() {
    for (const auto& [id, retry] : m_pending_retries) {
        if (retry.handle) {
            m_scheduler.cancel(retry.handle);
        }
    }
    m_pending_retries.clear();
}

void ProgressionGuard::announce(core::RewardGrantedEvent event) {
    // Granted from a RewardGranted handler: the channel cannot be re-entered,
    // so the event waits for the outer dispatch to finish
    if (m_bus.is_dispatching(core::EventType::RewardGranted)) {
        log(LogLevel::Debug, "[ProgressionGuard] Deferring announcement of '" + event.reward_id + "'");
        m_bus.queue(std::move(event), SOURCE);
        return;
    }

    m_bus.dispatch(std::move(event), SOURCE);

    // Follow-up grants made by handlers, including those made while flushing
    while (m_bus.has_queued_events()) {
        m_bus.flush();
    }
}

void ProgressionGuard::report_failure(const core::CriticalRewardFailure& failure) {
    log(LogLevel::Error, std::string("[ProgressionGuard] ") + failure.what());

    core::ErrorEvent event;
    event.category = failure.category();
    event.message = failure.what();
    event.origin = SOURCE;
    event.detail = failure.reward_id();
    m_bus.dispatch(event, SOURCE);
}

// ============================================================================
// Records
// ============================================================================

CriticalReward& ProgressionGuard::record_for(const std::string& reward_id) {
    auto it = m_records.find(reward_id);
    if (it != m_records.end()) {
        return it->second;
    }

    CriticalReward record;
    record.id = reward_id;
    if (auto stored = m_store.read(m_save_id, reward_id)) {
        record = *stored;
    }
    return m_records.emplace(reward_id, record).first->second;
}

bool ProgressionGuard::is_granted(const std::string& reward_id) const {
    auto record = get_reward(reward_id);
    return record && record->granted;
}

std::optional<CriticalReward> ProgressionGuard::get_reward(const std::string& reward_id) const {
    auto it = m_records.find(reward_id);
    if (it != m_records.end()) {
        return it->second;
    }
    return m_store.read(m_save_id, reward_id);
}

// ============================================================================
// Rules
// ============================================================================

void ProgressionGuard::add_rule(RewardRule rule) {
    if (!m_rule_connection.connected()) {
        m_rule_connection = m_bus.subscribe<core::CriticalPathReachedEvent>(
            [this](const core::CriticalPathReachedEvent& event) { on_critical_path(event); });
    }
    m_rules.push_back(std::move(rule));
}

void ProgressionGuard::on_critical_path(const core::CriticalPathReachedEvent& event) {
    for (const auto& rule : m_rules) {
        if (rule.trigger_state_id != event.state_id) continue;
        if (!rule.graph_id.empty() && rule.graph_id != event.graph_id) continue;

        RewardTier tier = rule.select_tier ? rule.select_tier(event) : rule.tier;
        try {
            grant(rule.reward_id, tier, "rule:" + event.state_id);
        } catch (const core::CriticalRewardFailure& e) {
            // Already reported; the record stays open for the next call site
            log(LogLevel::Warn, std::string("[ProgressionGuard] Rule grant deferred: ") + e.what());
        }
    }
}

} // namespace narrative::progression
