#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace engine::core
{

using TimerId = std::uint64_t;
constexpr TimerId kInvalidTimerId = 0;

/// Cooperative timer queue advanced by the frame loop.
/// Timers never fire on their own: Advance() walks simulated time forward and
/// runs every due callback in deadline order on the caller's thread. Callbacks
/// may cancel any timer (including themselves) or schedule new ones.
class TimerQueue
{
public:
    using Callback = std::function<void()>;

    TimerId SchedulePeriodic(double intervalSeconds, Callback callback);
    TimerId ScheduleOnce(double delaySeconds, Callback callback);

    /// @return True if the timer was pending and is now cancelled.
    bool Cancel(TimerId id);
    void CancelAll();

    void Advance(double deltaSeconds);

    [[nodiscard]] bool IsPending(TimerId id) const;
    [[nodiscard]] std::size_t PendingCount() const;
    [[nodiscard]] double NowSeconds() const { return m_nowSeconds; }

private:
    struct Timer
    {
        TimerId id = kInvalidTimerId;
        double intervalSeconds = 0.0;
        double nextFireSeconds = 0.0;
        bool periodic = false;
        bool cancelled = false;
        Callback callback;
    };

    TimerId Schedule(double delaySeconds, bool periodic, Callback callback);
    [[nodiscard]] Timer* FindNextDue(double untilSeconds);
    Timer* Find(TimerId id);
    void Purge();

    static constexpr double kMinIntervalSeconds = 1.0e-3;

    std::vector<Timer> m_timers;
    double m_nowSeconds = 0.0;
    TimerId m_nextId = 1;
};

} // namespace engine::core
