#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <vector>

#include "engine/core/TimerQueue.hpp"
#include "game/gameplay/GameTypes.hpp"
#include "game/gameplay/ReactionTelemetry.hpp"

namespace game::gameplay
{

enum class VariantPhase : std::uint8_t
{
    Idle,
    Active,
    Succeeded,
    Failed
};

[[nodiscard]] const char* VariantPhaseToText(VariantPhase phase);

/// Common shell of the four mini-games: Idle -> Active -> {Succeeded | Failed}.
///
/// All periodic work (countdown, spawns, playback, movement) runs on timers
/// registered in the session's TimerQueue and owned by the variant; every
/// exit from Active cancels them. The terminal callback fires at most once.
class GameVariant
{
public:
    using TerminalCallback = std::function<void(int score, bool success)>;
    using ReactionCallback = std::function<void(double latencyMs)>;

    GameVariant(const Level& level, engine::core::TimerQueue& timers, std::mt19937& rng);
    virtual ~GameVariant();

    GameVariant(const GameVariant&) = delete;
    GameVariant& operator=(const GameVariant&) = delete;

    void SetTerminalCallback(TerminalCallback callback) { m_onTerminal = std::move(callback); }
    void SetReactionCallback(ReactionCallback callback) { m_onReaction = std::move(callback); }

    /// Idle -> Active. Starts the one-second countdown and the variant's own timers.
    void Start();

    /// Cooperative per-frame tick at the session's fixed step.
    void FixedUpdate(double fixedDeltaSeconds);

    /// Feeds the reaction latency to telemetry, then applies the game rules.
    /// @return False when the input was refused (not active, or the variant is
    /// not taking input right now).
    bool HandleInput(Direction direction, double timestampMs);

    /// Unmount: cancels every owned timer and refuses further input without
    /// reporting a terminal outcome.
    void Stop();

    [[nodiscard]] virtual Variant Kind() const = 0;
    [[nodiscard]] virtual int Score() const = 0;

    [[nodiscard]] VariantPhase Phase() const { return m_phase; }
    [[nodiscard]] bool IsActive() const { return m_phase == VariantPhase::Active && !m_stopped; }
    [[nodiscard]] int TimeRemainingSeconds() const { return m_timeRemainingSeconds; }
    [[nodiscard]] const Level& GetLevel() const { return m_level; }
    [[nodiscard]] std::size_t OwnedTimerCount() const;

protected:
    virtual void OnStart() = 0;
    virtual void OnFixedUpdate(double fixedDeltaSeconds);
    virtual void OnInput(Direction direction) = 0;
    [[nodiscard]] virtual bool AcceptsInput() const { return true; }

    /// Leaves Active exactly once and reports the outcome.
    void Finish(int score, bool success);

    engine::core::TimerId StartPeriodicTimer(double intervalSeconds, engine::core::TimerQueue::Callback callback);
    engine::core::TimerId StartOneShotTimer(double delaySeconds, engine::core::TimerQueue::Callback callback);
    void StopTimer(engine::core::TimerId& id);

    [[nodiscard]] std::mt19937& Rng() { return m_rng; }

private:
    void OnCountdownTick();
    void CancelOwnedTimers();

    Level m_level;
    engine::core::TimerQueue& m_timers;
    std::mt19937& m_rng;

    VariantPhase m_phase = VariantPhase::Idle;
    bool m_stopped = false;
    int m_timeRemainingSeconds = 0;
    std::vector<engine::core::TimerId> m_ownedTimers;

    ReactionTelemetry m_telemetry;
    TerminalCallback m_onTerminal;
    ReactionCallback m_onReaction;
};

/// Builds a fresh, idle variant for one attempt.
[[nodiscard]] std::unique_ptr<GameVariant> CreateVariant(
    Variant variant,
    const Level& level,
    engine::core::TimerQueue& timers,
    std::mt19937& rng);

} // namespace game::gameplay
