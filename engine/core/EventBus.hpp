#pragma once

#include <cstddef>
#include <functional>
#include <queue>
#include <utility>
#include <vector>

namespace engine::core
{
/// Single-threaded FIFO event queue. Producers publish at any time; events are
/// only delivered from DispatchQueued(), which the owner calls once per frame,
/// so every handler runs on the same logical thread as the simulation.
template <typename TEvent>
class EventBus
{
public:
    using Handler = std::function<void(const TEvent&)>;

    void Subscribe(Handler handler)
    {
        m_handlers.push_back(std::move(handler));
    }

    void Publish(TEvent event)
    {
        m_queue.push(std::move(event));
    }

    /// Delivers everything queued so far. Events published by a handler are
    /// delivered in the same call, after the ones already waiting.
    void DispatchQueued()
    {
        while (!m_queue.empty())
        {
            TEvent event = std::move(m_queue.front());
            m_queue.pop();

            for (const Handler& handler : m_handlers)
            {
                handler(event);
            }
        }
    }

    void Clear()
    {
        std::queue<TEvent> empty;
        m_queue.swap(empty);
    }

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }

private:
    std::vector<Handler> m_handlers;
    std::queue<TEvent> m_queue;
};
} // namespace engine::core
