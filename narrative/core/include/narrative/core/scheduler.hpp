#pragma once

#include <cstdint>
#include <functional>
#include <map>

namespace narrative::core {

// ============================================================================
// TimerHandle - Unique identifier for scheduled callbacks
// ============================================================================

struct TimerHandle {
    uint64_t id = 0;

    bool valid() const { return id != 0; }
    explicit operator bool() const { return valid(); }

    bool operator==(const TimerHandle& other) const { return id == other.id; }
    bool operator!=(const TimerHandle& other) const { return id != other.id; }
};

// ============================================================================
// IScheduler - deferred execution seam
//
// Components that need to wait (retry backoff) schedule through this
// interface so tests can drive time explicitly.
// ============================================================================

class IScheduler {
public:
    using Callback = std::function<void()>;

    virtual ~IScheduler() = default;

    virtual TimerHandle schedule(float delay_seconds, Callback callback) = 0;
    virtual void cancel(TimerHandle handle) = 0;
    virtual bool is_active(TimerHandle handle) const = 0;
};

// ============================================================================
// TimerScheduler - one-shot callbacks on a clock advanced by update()
// ============================================================================

class TimerScheduler : public IScheduler {
public:
    TimerScheduler() = default;

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    TimerHandle schedule(float delay_seconds, Callback callback) override;
    void cancel(TimerHandle handle) override;
    bool is_active(TimerHandle handle) const override;

    // Advances the clock by dt seconds and runs every callback due by then,
    // earliest first. Callbacks scheduled from a callback wait for a later
    // update, whatever their delay.
    void update(float dt);

    size_t pending_count() const { return m_pending.size(); }
    double now() const { return m_now; }

private:
    struct Pending {
        double due = 0.0;
        Callback callback;
    };

    std::map<uint64_t, Pending> m_pending;
    uint64_t m_next_id = 1;
    double m_now = 0.0;
};

} // namespace narrative::core
