#include <narrative/core/scheduler.hpp>
#include <algorithm>
#include <utility>
#include <vector>

namespace narrative::core {

TimerHandle TimerScheduler::schedule(float delay_seconds, Callback callback) {
    TimerHandle handle{m_next_id++};
    m_pending[handle.id] = Pending{m_now + std::max(0.0f, delay_seconds), std::move(callback)};
    return handle;
}

void TimerScheduler::cancel(TimerHandle handle) {
    m_pending.erase(handle.id);
}

bool TimerScheduler::is_active(TimerHandle handle) const {
    return m_pending.count(handle.id) > 0;
}

void TimerScheduler::update(float dt) {
    m_now += dt;

    // Snapshot first so callbacks added below are not run in this pass
    std::vector<std::pair<double, uint64_t>> due;
    for (const auto& [id, pending] : m_pending) {
        if (pending.due <= m_now) {
            due.emplace_back(pending.due, id);
        }
    }
    std::sort(due.begin(), due.end());

    for (const auto& entry : due) {
        auto it = m_pending.find(entry.second);
        if (it == m_pending.end()) {
            continue;   // Cancelled by an earlier callback
        }

        Callback callback = std::move(it->second.callback);
        m_pending.erase(it);
        if (callback) {
            callback();
        }
    }
}

} // namespace narrative::core
