#pragma once

#include <narrative/progression/critical_reward.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace narrative::progression {

// ============================================================================
// IRewardStore - persistence seam for critical reward records
// ============================================================================

class IRewardStore {
public:
    virtual ~IRewardStore() = default;

    virtual std::optional<CriticalReward> read(const std::string& save_id,
                                               const std::string& reward_id) const = 0;

    // Returns false when the record could not be persisted
    virtual bool write(const std::string& save_id, const CriticalReward& record) = 0;
};

// ============================================================================
// MemoryRewardStore
// ============================================================================

class MemoryRewardStore : public IRewardStore {
public:
    std::optional<CriticalReward> read(const std::string& save_id,
                                       const std::string& reward_id) const override;
    bool write(const std::string& save_id, const CriticalReward& record) override;

    // The next `count` writes fail without storing anything
    void fail_next_writes(uint32_t count) { m_failures_remaining = count; }

    uint32_t write_count() const { return m_write_count; }
    uint32_t successful_write_count() const { return m_successful_writes; }
    size_t size() const { return m_records.size(); }

private:
    std::map<std::pair<std::string, std::string>, CriticalReward> m_records;
    uint32_t m_failures_remaining = 0;
    uint32_t m_write_count = 0;
    uint32_t m_successful_writes = 0;
};

// ============================================================================
// JsonRewardStore - one JSON document per save under a directory
//
// {
//   "save_id": "slot-1",
//   "rewards": { "journal": { "granted": true, "tier": "annotated", "attempts": 1 } }
// }
// ============================================================================

class JsonRewardStore : public IRewardStore {
public:
    explicit JsonRewardStore(const std::string& directory);

    std::optional<CriticalReward> read(const std::string& save_id,
                                       const std::string& reward_id) const override;
    bool write(const std::string& save_id, const CriticalReward& record) override;

    std::string path_for(const std::string& save_id) const;

private:
    std::string m_directory;
};

} // namespace narrative::progression
