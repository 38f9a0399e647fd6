#include "game/gameplay/variants/GridGrowthGame.hpp"

#include <algorithm>
#include <iostream>

#include "game/maps/MazeGenerator.hpp"

namespace game::gameplay
{

GridGrowthGame::GridGrowthGame(const Level& level, engine::core::TimerQueue& timers, std::mt19937& rng)
    : GameVariant(level, timers, rng)
{
}

double GridGrowthGame::StepIntervalSeconds() const
{
    const float speed = std::max(GetLevel().speed, 0.1F);
    return kBaseStepSeconds / static_cast<double>(speed);
}

bool GridGrowthGame::InBounds(const glm::ivec2& cell)
{
    return cell.x >= 0 && cell.y >= 0 && cell.x < kGridWidth && cell.y < kGridHeight;
}

void GridGrowthGame::OnStart()
{
    m_state = GridGrowthState{};
    m_state.body = {glm::ivec2{10, 10}, glm::ivec2{9, 10}, glm::ivec2{8, 10}};

    std::vector<glm::ivec2> excluded = m_state.body;
    excluded.push_back(m_state.target);
    const std::vector<glm::ivec2> cells = maps::ScatterCells(
        glm::ivec2{0, 0},
        glm::ivec2{kGridWidth - 1, kGridHeight - 1},
        GetLevel().obstacleCount,
        excluded,
        Rng());
    int placed = 0;
    for (const glm::ivec2& cell : cells)
    {
        placed += PlaceObstacle(cell) ? 1 : 0;
    }
    if (placed < GetLevel().obstacleCount)
    {
        std::cout << "GridGrowthGame: WARNING - Placed " << placed << " of " << GetLevel().obstacleCount
                  << " obstacles\n";
    }

    StartPeriodicTimer(StepIntervalSeconds(), [this]() { Step(); });
}

void GridGrowthGame::OnInput(Direction direction)
{
    // Compared against the last direction actually moved in, so two quick
    // turns inside one step cannot fold the head back onto the neck.
    if (direction == Opposite(m_state.committed))
    {
        ++m_state.rejectedTurns;
        return;
    }
    m_state.pending = direction;
}

void GridGrowthGame::Step()
{
    if (!IsActive())
    {
        return;
    }

    ++m_state.steps;
    m_state.committed = m_state.pending;
    const glm::ivec2 head = m_state.body.front() + DirectionOffset(m_state.committed);
    const bool eating = head == m_state.target;

    // The tail cell is vacated this step unless the body grows.
    const auto bodyEnd = eating ? m_state.body.end() : m_state.body.end() - 1;
    const bool hitSelf = std::find(m_state.body.begin(), bodyEnd, head) != bodyEnd;
    const bool hitObstacle = std::find(m_state.obstacles.begin(), m_state.obstacles.end(), head) != m_state.obstacles.end();

    if (!InBounds(head) || hitSelf || hitObstacle)
    {
        Finish(m_state.score, false);
        return;
    }

    m_state.body.insert(m_state.body.begin(), head);
    if (!eating)
    {
        m_state.body.pop_back();
        return;
    }

    m_state.score += kPointsPerTarget;
    if (m_state.score >= kWinningScore)
    {
        Finish(m_state.score, true);
        return;
    }
    RelocateTarget();
}

void GridGrowthGame::RelocateTarget()
{
    std::vector<glm::ivec2> excluded = m_state.body;
    excluded.insert(excluded.end(), m_state.obstacles.begin(), m_state.obstacles.end());

    const std::vector<glm::ivec2> cells = maps::ScatterCells(
        glm::ivec2{0, 0},
        glm::ivec2{kGridWidth - 1, kGridHeight - 1},
        1,
        excluded,
        Rng());

    if (cells.empty())
    {
        std::cout << "GridGrowthGame: WARNING - No free cell for the next target\n";
        return;
    }
    m_state.target = cells.front();
}

bool GridGrowthGame::IsOccupied(const glm::ivec2& cell) const
{
    return std::find(m_state.body.begin(), m_state.body.end(), cell) != m_state.body.end()
        || std::find(m_state.obstacles.begin(), m_state.obstacles.end(), cell) != m_state.obstacles.end();
}

bool GridGrowthGame::SetTarget(const glm::ivec2& cell)
{
    if (!InBounds(cell) || IsOccupied(cell))
    {
        return false;
    }
    m_state.target = cell;
    return true;
}

bool GridGrowthGame::PlaceObstacle(const glm::ivec2& cell)
{
    if (!InBounds(cell) || IsOccupied(cell) || cell == m_state.target)
    {
        return false;
    }
    m_state.obstacles.push_back(cell);
    return true;
}

} // namespace game::gameplay
