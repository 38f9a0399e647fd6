#include "game/gameplay/ReactionTelemetry.hpp"

#include <algorithm>

namespace game::gameplay
{
std::optional<double> ReactionTelemetry::Record(double timestampMs)
{
    if (!m_previousMs.has_value())
    {
        m_previousMs = timestampMs;
        return std::nullopt;
    }

    // Inputs are assumed monotonic; an out-of-order stamp reads as zero latency.
    const double latency = std::max(0.0, timestampMs - *m_previousMs);
    m_previousMs = std::max(timestampMs, *m_previousMs);
    return latency;
}
} // namespace game::gameplay
