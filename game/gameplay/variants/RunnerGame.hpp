#pragma once

#include <vector>

#include <glm/vec2.hpp>

#include "game/gameplay/variants/GameVariant.hpp"

namespace game::gameplay
{

struct RunnerObstacle
{
    int id = 0;
    glm::vec2 position{0.0F}; // top-left corner
    glm::vec2 size{0.0F};
};

struct RunnerState
{
    glm::vec2 player{50.0F, 250.0F};
    std::vector<RunnerObstacle> obstacles;
    int scoreTenths = 0;
    int nextObstacleId = 1;
    int spawnRolls = 0;
};

/// Obstacle-avoidance runner: obstacles slide in from the right edge, the player
/// dodges on directional input, score accrues per step until it reaches 100.
class RunnerGame final : public GameVariant
{
public:
    RunnerGame(const Level& level, engine::core::TimerQueue& timers, std::mt19937& rng);

    [[nodiscard]] Variant Kind() const override { return Variant::Runner; }
    [[nodiscard]] int Score() const override { return m_state.scoreTenths / 10; }
    [[nodiscard]] double ExactScore() const { return static_cast<double>(m_state.scoreTenths) / 10.0; }

    [[nodiscard]] const RunnerState& GetState() const { return m_state; }

    /// Chance (percent) that a spawn tick produces an obstacle.
    [[nodiscard]] int SpawnChancePercent() const;
    [[nodiscard]] double SpawnIntervalSeconds() const;
    [[nodiscard]] float SlideSpeedPerStep() const;

    /// Adds an obstacle at the right edge with a given vertical span.
    void SpawnObstacle(float top, float height);

    [[nodiscard]] static bool Overlaps(const glm::vec2& playerCenter, const RunnerObstacle& obstacle);

    static constexpr float kPlayerRadius = 20.0F;
    static constexpr float kMoveStep = 15.0F;
    static constexpr float kMinX = 20.0F;
    static constexpr float kMaxX = 750.0F;
    static constexpr float kMinY = 20.0F;
    static constexpr float kMaxY = 450.0F;
    static constexpr float kObstacleWidth = 30.0F;
    static constexpr int kMinObstacleHeight = 50;
    static constexpr int kObstacleHeightSpread = 150;
    static constexpr float kBaseSlidePerStep = 3.0F;
    static constexpr double kBaseSpawnIntervalSeconds = 1.5;
    static constexpr int kMaxScoreTenths = 1000;

protected:
    void OnStart() override;
    void OnFixedUpdate(double fixedDeltaSeconds) override;
    void OnInput(Direction direction) override;

private:
    void OnSpawnTick();
    void CheckOutcome();

    RunnerState m_state;
};

} // namespace game::gameplay
