#pragma once

namespace engine::core
{
/// Simulation clock fed with the host's monotonic seconds once per frame.
///
/// Frame deltas are clamped to kMaxFrameDeltaSeconds; wall time beyond the
/// clamp is dropped, not replayed. SimulatedSeconds() is the only elapsed time
/// the simulation ever sees, so timers, fixed steps and durations measured on
/// it agree with each other even when frames stall.
class Time
{
public:
    explicit Time(double fixedDeltaSeconds = 1.0 / 60.0);

    /// Starts a new run; the next BeginFrame() yields a zero delta.
    void Reset();

    void BeginFrame(double nowSeconds);
    [[nodiscard]] bool ShouldRunFixedStep() const;
    void ConsumeFixedStep();

    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double FixedDeltaSeconds() const { return m_fixedDeltaSeconds; }
    [[nodiscard]] double SimulatedSeconds() const { return m_simulatedSeconds; }
    /// Wall time discarded by the clamp since Reset().
    [[nodiscard]] double DroppedSeconds() const { return m_droppedSeconds; }
    [[nodiscard]] unsigned long long FrameIndex() const { return m_frameIndex; }

    static constexpr double kMaxFrameDeltaSeconds = 0.25;

private:
    double m_fixedDeltaSeconds;
    double m_deltaSeconds = 0.0;
    double m_simulatedSeconds = 0.0;
    double m_droppedSeconds = 0.0;
    double m_accumulator = 0.0;
    double m_previousFrameSeconds = 0.0;
    unsigned long long m_frameIndex = 0;
    bool m_hasPreviousFrame = false;
};
} // namespace engine::core
