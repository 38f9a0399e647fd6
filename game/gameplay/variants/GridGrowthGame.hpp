#pragma once

#include <vector>

#include <glm/vec2.hpp>

#include "game/gameplay/variants/GameVariant.hpp"

namespace game::gameplay
{

struct GridGrowthState
{
    std::vector<glm::ivec2> body; // head first
    Direction committed = Direction::Right;
    Direction pending = Direction::Right;
    glm::ivec2 target{15, 10};
    std::vector<glm::ivec2> obstacles;
    int score = 0;
    int steps = 0;
    int rejectedTurns = 0;
};

/// Grid snake: the body advances one cell per step in the committed direction,
/// grows on the target cell, and dies on walls, itself or obstacles.
class GridGrowthGame final : public GameVariant
{
public:
    GridGrowthGame(const Level& level, engine::core::TimerQueue& timers, std::mt19937& rng);

    [[nodiscard]] Variant Kind() const override { return Variant::GridGrowth; }
    [[nodiscard]] int Score() const override { return m_state.score; }

    [[nodiscard]] const GridGrowthState& GetState() const { return m_state; }
    [[nodiscard]] double StepIntervalSeconds() const;

    /// Moves the target to `cell` if it is inside the grid and free.
    bool SetTarget(const glm::ivec2& cell);

    /// Adds an obstacle on a free, in-grid cell that is not the target.
    bool PlaceObstacle(const glm::ivec2& cell);

    [[nodiscard]] static bool InBounds(const glm::ivec2& cell);

    static constexpr int kGridWidth = 40;
    static constexpr int kGridHeight = 25;
    static constexpr int kPointsPerTarget = 10;
    static constexpr int kWinningScore = 100;
    static constexpr double kBaseStepSeconds = 0.3;

protected:
    void OnStart() override;
    void OnInput(Direction direction) override;

private:
    void Step();
    void RelocateTarget();
    [[nodiscard]] bool IsOccupied(const glm::ivec2& cell) const;

    GridGrowthState m_state;
};

} // namespace game::gameplay
