#include <narrative/progression/reward_store.hpp>
#include <narrative/core/filesystem.hpp>
#include <narrative/core/log.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace narrative::progression {

using namespace narrative::core;
using json = nlohmann::json;

// ============================================================================
// MemoryRewardStore
// ============================================================================

std::optional<CriticalReward> MemoryRewardStore::read(const std::string& save_id,
                                                      const std::string& reward_id) const {
    auto it = m_records.find({save_id, reward_id});
    if (it == m_records.end()) return std::nullopt;
    return it->second;
}

bool MemoryRewardStore::write(const std::string& save_id, const CriticalReward& record) {
    m_write_count++;
    if (m_failures_remaining > 0) {
        m_failures_remaining--;
        return false;
    }

    m_records[{save_id, record.id}] = record;
    m_successful_writes++;
    return true;
}

// ============================================================================
// JsonRewardStore
// ============================================================================

namespace {

// A missing file is an empty document; an unreadable one is nullopt
std::optional<json> load_document(const std::string& path) {
    if (!FileSystem::exists(path)) {
        return json::object();
    }

    try {
        json document = json::parse(FileSystem::read_text(path));
        if (document.is_object()) return document;
        log(LogLevel::Error, "[RewardStore] Not a reward document: " + path);
    } catch (const json::exception& e) {
        log(LogLevel::Error, "[RewardStore] Failed to parse " + path + ": " + e.what());
    }
    return std::nullopt;
}

} // namespace

JsonRewardStore::JsonRewardStore(const std::string& directory)
    : m_directory(directory) {
}

std::string JsonRewardStore::path_for(const std::string& save_id) const {
    return (std::filesystem::path(m_directory) / (save_id + ".rewards.json")).string();
}

std::optional<CriticalReward> JsonRewardStore::read(const std::string& save_id,
                                                    const std::string& reward_id) const {
    auto document = load_document(path_for(save_id));
    if (!document || !document->contains("rewards") || !(*document)["rewards"].contains(reward_id)) {
        return std::nullopt;
    }

    try {
        const json& j = (*document)["rewards"][reward_id];
        CriticalReward record;
        record.id = reward_id;
        record.granted = j.value("granted", false);
        record.attempts = j.value("attempts", 0u);

        std::string tier = j.value("tier", "base");
        auto parsed = tier_from_string(tier);
        if (!parsed) {
            log(LogLevel::Warn, "[RewardStore] Unknown tier '" + tier + "' for '" + reward_id +
                "', treating as base");
        }
        record.granted_tier = parsed.value_or(RewardTier::Base);
        return record;
    } catch (const json::exception& e) {
        log(LogLevel::Error, "[RewardStore] Invalid record '" + reward_id + "': " + e.what());
        return std::nullopt;
    }
}

bool JsonRewardStore::write(const std::string& save_id, const CriticalReward& record) {
    std::string path = path_for(save_id);
    auto document = load_document(path);
    if (!document) {
        // Rewriting would drop every other record in the save
        log(LogLevel::Error, "[RewardStore] Refusing to overwrite unreadable " + path);
        return false;
    }

    std::string text;
    try {
        (*document)["save_id"] = save_id;
        (*document)["rewards"][record.id] = {
            {"granted", record.granted},
            {"tier", to_string(record.granted_tier)},
            {"attempts", record.attempts}
        };
        text = document->dump(4);
    } catch (const json::exception& e) {
        log(LogLevel::Error, "[RewardStore] Cannot update " + path + ": " + e.what());
        return false;
    }

    if (!FileSystem::write_text(path, text)) {
        log(LogLevel::Error, "[RewardStore] Failed to write " + path);
        return false;
    }
    return true;
}

} // namespace narrative::progression
