#include "game/gameplay/variants/GameVariant.hpp"

#include <algorithm>
#include <iostream>

#include "game/gameplay/variants/GridGrowthGame.hpp"
#include "game/gameplay/variants/MazeNavigationGame.hpp"
#include "game/gameplay/variants/PatternRecallGame.hpp"
#include "game/gameplay/variants/RunnerGame.hpp"

namespace game::gameplay
{

const char* VariantPhaseToText(VariantPhase phase)
{
    switch (phase)
    {
        case VariantPhase::Idle: return "idle";
        case VariantPhase::Active: return "active";
        case VariantPhase::Succeeded: return "succeeded";
        case VariantPhase::Failed: return "failed";
        default: return "unknown";
    }
}

GameVariant::GameVariant(const Level& level, engine::core::TimerQueue& timers, std::mt19937& rng)
    : m_level(level)
    , m_timers(timers)
    , m_rng(rng)
    , m_timeRemainingSeconds(std::max(level.timeLimitSeconds, 1))
{
}

GameVariant::~GameVariant()
{
    CancelOwnedTimers();
}

void GameVariant::Start()
{
    if (m_phase != VariantPhase::Idle || m_stopped)
    {
        return;
    }

    m_phase = VariantPhase::Active;
    m_telemetry.Reset();
    StartPeriodicTimer(1.0, [this]() { OnCountdownTick(); });
    OnStart();
}

void GameVariant::FixedUpdate(double fixedDeltaSeconds)
{
    if (!IsActive())
    {
        return;
    }
    OnFixedUpdate(fixedDeltaSeconds);
}

void GameVariant::OnFixedUpdate(double /*fixedDeltaSeconds*/)
{
}

bool GameVariant::HandleInput(Direction direction, double timestampMs)
{
    if (!IsActive() || !AcceptsInput())
    {
        return false;
    }

    if (const auto latency = m_telemetry.Record(timestampMs))
    {
        if (m_onReaction)
        {
            m_onReaction(*latency);
        }
    }

    OnInput(direction);
    return true;
}

void GameVariant::Stop()
{
    m_stopped = true;
    CancelOwnedTimers();
}

std::size_t GameVariant::OwnedTimerCount() const
{
    return static_cast<std::size_t>(std::count_if(m_ownedTimers.begin(), m_ownedTimers.end(),
        [this](engine::core::TimerId id) { return m_timers.IsPending(id); }));
}

void GameVariant::Finish(int score, bool success)
{
    if (m_phase != VariantPhase::Active || m_stopped)
    {
        return;
    }

    m_phase = success ? VariantPhase::Succeeded : VariantPhase::Failed;
    CancelOwnedTimers();

    if (m_onTerminal)
    {
        m_onTerminal(score, success);
    }
}

engine::core::TimerId GameVariant::StartPeriodicTimer(double intervalSeconds, engine::core::TimerQueue::Callback callback)
{
    const engine::core::TimerId id = m_timers.SchedulePeriodic(intervalSeconds, std::move(callback));
    m_ownedTimers.push_back(id);
    return id;
}

engine::core::TimerId GameVariant::StartOneShotTimer(double delaySeconds, engine::core::TimerQueue::Callback callback)
{
    const engine::core::TimerId id = m_timers.ScheduleOnce(delaySeconds, std::move(callback));
    m_ownedTimers.push_back(id);
    return id;
}

void GameVariant::StopTimer(engine::core::TimerId& id)
{
    if (id == engine::core::kInvalidTimerId)
    {
        return;
    }
    m_timers.Cancel(id);
    m_ownedTimers.erase(std::remove(m_ownedTimers.begin(), m_ownedTimers.end(), id), m_ownedTimers.end());
    id = engine::core::kInvalidTimerId;
}

void GameVariant::OnCountdownTick()
{
    if (!IsActive())
    {
        return;
    }

    if (m_timeRemainingSeconds <= 1)
    {
        m_timeRemainingSeconds = 0;
        Finish(Score(), false);
        return;
    }
    --m_timeRemainingSeconds;
}

void GameVariant::CancelOwnedTimers()
{
    for (engine::core::TimerId id : m_ownedTimers)
    {
        m_timers.Cancel(id);
    }
    m_ownedTimers.clear();
}

std::unique_ptr<GameVariant> CreateVariant(
    Variant variant,
    const Level& level,
    engine::core::TimerQueue& timers,
    std::mt19937& rng)
{
    switch (variant)
    {
        case Variant::Runner: return std::make_unique<RunnerGame>(level, timers, rng);
        case Variant::PatternRecall: return std::make_unique<PatternRecallGame>(level, timers, rng);
        case Variant::GridGrowth: return std::make_unique<GridGrowthGame>(level, timers, rng);
        case Variant::MazeNavigation: return std::make_unique<MazeNavigationGame>(level, timers, rng);
    }

    std::cout << "GameVariant: ERROR - Unknown variant " << static_cast<int>(variant) << "\n";
    return nullptr;
}

} // namespace game::gameplay
