#include "engine/core/TimerQueue.hpp"

#include <algorithm>
#include <utility>

namespace engine::core
{

TimerId TimerQueue::SchedulePeriodic(double intervalSeconds, Callback callback)
{
    return Schedule(intervalSeconds, true, std::move(callback));
}

TimerId TimerQueue::ScheduleOnce(double delaySeconds, Callback callback)
{
    return Schedule(delaySeconds, false, std::move(callback));
}

TimerId TimerQueue::Schedule(double delaySeconds, bool periodic, Callback callback)
{
    if (!callback)
    {
        return kInvalidTimerId;
    }

    Timer timer;
    timer.id = m_nextId++;
    timer.intervalSeconds = std::max(delaySeconds, kMinIntervalSeconds);
    timer.nextFireSeconds = m_nowSeconds + timer.intervalSeconds;
    timer.periodic = periodic;
    timer.callback = std::move(callback);
    m_timers.push_back(std::move(timer));
    return m_timers.back().id;
}

bool TimerQueue::Cancel(TimerId id)
{
    Timer* timer = Find(id);
    if (timer == nullptr || timer->cancelled)
    {
        return false;
    }
    timer->cancelled = true;
    return true;
}

void TimerQueue::CancelAll()
{
    for (Timer& timer : m_timers)
    {
        timer.cancelled = true;
    }
}

void TimerQueue::Advance(double deltaSeconds)
{
    const double targetSeconds = m_nowSeconds + std::max(deltaSeconds, 0.0);

    while (Timer* timer = FindNextDue(targetSeconds))
    {
        m_nowSeconds = timer->nextFireSeconds;

        // Copy out before invoking: the callback may schedule timers and
        // reallocate m_timers.
        Callback callback = timer->callback;
        if (timer->periodic)
        {
            timer->nextFireSeconds += timer->intervalSeconds;
        }
        else
        {
            timer->cancelled = true;
        }

        callback();
    }

    m_nowSeconds = targetSeconds;
    Purge();
}

bool TimerQueue::IsPending(TimerId id) const
{
    const auto it = std::find_if(m_timers.begin(), m_timers.end(),
        [id](const Timer& t) { return t.id == id; });
    return it != m_timers.end() && !it->cancelled;
}

std::size_t TimerQueue::PendingCount() const
{
    return static_cast<std::size_t>(std::count_if(m_timers.begin(), m_timers.end(),
        [](const Timer& t) { return !t.cancelled; }));
}

TimerQueue::Timer* TimerQueue::FindNextDue(double untilSeconds)
{
    Timer* best = nullptr;
    for (Timer& timer : m_timers)
    {
        if (timer.cancelled || timer.nextFireSeconds > untilSeconds)
        {
            continue;
        }
        // Ties resolve by creation order, which is vector order.
        if (best == nullptr || timer.nextFireSeconds < best->nextFireSeconds)
        {
            best = &timer;
        }
    }
    return best;
}

TimerQueue::Timer* TimerQueue::Find(TimerId id)
{
    auto it = std::find_if(m_timers.begin(), m_timers.end(),
        [id](const Timer& t) { return t.id == id; });
    return it != m_timers.end() ? &(*it) : nullptr;
}

void TimerQueue::Purge()
{
    m_timers.erase(
        std::remove_if(m_timers.begin(), m_timers.end(),
            [](const Timer& t) { return t.cancelled; }),
        m_timers.end()
    );
}

} // namespace engine::core
