#include "game/gameplay/variants/MazeNavigationGame.hpp"

#include <algorithm>
#include <iostream>

#include <glm/common.hpp>

namespace game::gameplay
{

MazeNavigationGame::MazeNavigationGame(
    const Level& level,
    engine::core::TimerQueue& timers,
    std::mt19937& rng,
    const glm::ivec2& mazeSize)
    : GameVariant(level, timers, rng)
    , m_mazeSize(glm::max(mazeSize, glm::ivec2{1, 1}))
{
}

int MazeNavigationGame::ComputeExitScore(int remainingSeconds, int timeLimitSeconds)
{
    if (timeLimitSeconds <= 0)
    {
        return kExitBonus;
    }
    const int clampedRemaining = std::clamp(remainingSeconds, 0, timeLimitSeconds);
    return (100 * clampedRemaining) / timeLimitSeconds + kExitBonus;
}

maps::MazeSide MazeNavigationGame::ToMazeSide(Direction direction)
{
    switch (direction)
    {
        case Direction::Up: return maps::MazeSide::Top;
        case Direction::Down: return maps::MazeSide::Bottom;
        case Direction::Left: return maps::MazeSide::Left;
        case Direction::Right: return maps::MazeSide::Right;
    }
    return maps::MazeSide::Top;
}

void MazeNavigationGame::OnStart()
{
    m_state = MazeNavigationState{};
    m_state.maze = maps::MazeGenerator::Generate(m_mazeSize.x, m_mazeSize.y, Rng());
    m_state.player = m_state.maze.Entrance();

    // Keep the unique entrance->exit route clear so the level stays solvable.
    const std::vector<glm::ivec2> solution = m_state.maze.FindPath(m_state.maze.Entrance(), m_state.maze.Exit());
    m_state.obstacles = maps::MazeGenerator::PlaceObstacles(m_state.maze, GetLevel().obstacleCount, Rng(), solution);

    if (static_cast<int>(m_state.obstacles.size()) < GetLevel().obstacleCount)
    {
        std::cout << "MazeNavigationGame: WARNING - Placed " << m_state.obstacles.size() << " of "
                  << GetLevel().obstacleCount << " obstacles\n";
    }
}

void MazeNavigationGame::OnInput(Direction direction)
{
    const maps::MazeSide side = ToMazeSide(direction);
    if (!m_state.maze.CanMove(m_state.player, side))
    {
        ++m_state.blockedMoves;
        return;
    }

    const glm::ivec2 next = m_state.player + maps::SideOffset(side);
    if (std::find(m_state.obstacles.begin(), m_state.obstacles.end(), next) != m_state.obstacles.end())
    {
        Finish(m_state.score, false);
        return;
    }

    m_state.player = next;
    ++m_state.moves;

    if (m_state.player == m_state.maze.Exit())
    {
        m_state.score = ComputeExitScore(TimeRemainingSeconds(), GetLevel().timeLimitSeconds);
        Finish(m_state.score, true);
    }
}

} // namespace game::gameplay
