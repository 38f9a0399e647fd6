#pragma once

#include <optional>

namespace game::gameplay
{
/// Turns consecutive input timestamps into inter-action latencies.
/// The first input of an attempt only primes the collector.
class ReactionTelemetry
{
public:
    /// @param timestampMs Arrival time of an accepted input (monotonic clock).
    /// @return Milliseconds since the previous recorded input, or nothing on the first call.
    std::optional<double> Record(double timestampMs);

    void Reset() { m_previousMs.reset(); }
    [[nodiscard]] bool IsPrimed() const { return m_previousMs.has_value(); }

private:
    std::optional<double> m_previousMs;
};
} // namespace game::gameplay
