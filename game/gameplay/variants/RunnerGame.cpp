#include "game/gameplay/variants/RunnerGame.hpp"

#include <algorithm>

#include <glm/common.hpp>

namespace game::gameplay
{

RunnerGame::RunnerGame(const Level& level, engine::core::TimerQueue& timers, std::mt19937& rng)
    : GameVariant(level, timers, rng)
{
}

int RunnerGame::SpawnChancePercent() const
{
    return std::max(100 - GetLevel().obstacleCount * 10, 30);
}

double RunnerGame::SpawnIntervalSeconds() const
{
    const float speed = std::max(GetLevel().speed, 0.1F);
    return kBaseSpawnIntervalSeconds / static_cast<double>(speed);
}

float RunnerGame::SlideSpeedPerStep() const
{
    return kBaseSlidePerStep * GetLevel().speed;
}

void RunnerGame::OnStart()
{
    m_state = RunnerState{};
    StartPeriodicTimer(SpawnIntervalSeconds(), [this]() { OnSpawnTick(); });
}

void RunnerGame::OnSpawnTick()
{
    if (!IsActive())
    {
        return;
    }

    ++m_state.spawnRolls;
    std::uniform_int_distribution<int> roll(0, 99);
    if (roll(Rng()) >= SpawnChancePercent())
    {
        return;
    }

    std::uniform_int_distribution<int> heightDist(kMinObstacleHeight, kMinObstacleHeight + kObstacleHeightSpread - 1);
    const int height = heightDist(Rng());
    std::uniform_int_distribution<int> topDist(0, static_cast<int>(kFieldHeight) - height - 1);
    SpawnObstacle(static_cast<float>(topDist(Rng())), static_cast<float>(height));
}

void RunnerGame::SpawnObstacle(float top, float height)
{
    RunnerObstacle obstacle;
    obstacle.id = m_state.nextObstacleId++;
    obstacle.position = glm::vec2{kFieldWidth, top};
    obstacle.size = glm::vec2{kObstacleWidth, height};
    m_state.obstacles.push_back(obstacle);
}

void RunnerGame::OnFixedUpdate(double /*fixedDeltaSeconds*/)
{
    const float slide = SlideSpeedPerStep();
    for (RunnerObstacle& obstacle : m_state.obstacles)
    {
        obstacle.position.x -= slide;
    }
    m_state.obstacles.erase(
        std::remove_if(m_state.obstacles.begin(), m_state.obstacles.end(),
            [](const RunnerObstacle& o) { return o.position.x + o.size.x <= 0.0F; }),
        m_state.obstacles.end()
    );

    m_state.scoreTenths = std::min(m_state.scoreTenths + 1, kMaxScoreTenths);
    CheckOutcome();
}

void RunnerGame::OnInput(Direction direction)
{
    const glm::vec2 step = glm::vec2(DirectionOffset(direction)) * kMoveStep;
    m_state.player = glm::clamp(m_state.player + step, glm::vec2{kMinX, kMinY}, glm::vec2{kMaxX, kMaxY});
    CheckOutcome();
}

void RunnerGame::CheckOutcome()
{
    for (const RunnerObstacle& obstacle : m_state.obstacles)
    {
        if (Overlaps(m_state.player, obstacle))
        {
            Finish(Score(), false);
            return;
        }
    }

    if (m_state.scoreTenths >= kMaxScoreTenths)
    {
        Finish(Score(), true);
    }
}

bool RunnerGame::Overlaps(const glm::vec2& playerCenter, const RunnerObstacle& obstacle)
{
    const glm::vec2 playerMin = playerCenter - glm::vec2{kPlayerRadius};
    const glm::vec2 playerMax = playerCenter + glm::vec2{kPlayerRadius};
    const glm::vec2 obstacleMax = obstacle.position + obstacle.size;

    return playerMax.x > obstacle.position.x
        && playerMin.x < obstacleMax.x
        && playerMax.y > obstacle.position.y
        && playerMin.y < obstacleMax.y;
}

} // namespace game::gameplay
