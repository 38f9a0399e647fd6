#include "game/maps/MazeGenerator.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <queue>
#include <stdexcept>
#include <string>

namespace game::maps
{
namespace
{
constexpr std::array<MazeSide, 4> kAllSides = {MazeSide::Top, MazeSide::Right, MazeSide::Bottom, MazeSide::Left};

bool& WallFlag(MazeCell& cell, MazeSide side)
{
    switch (side)
    {
        case MazeSide::Top: return cell.wallTop;
        case MazeSide::Right: return cell.wallRight;
        case MazeSide::Bottom: return cell.wallBottom;
        case MazeSide::Left: return cell.wallLeft;
    }
    return cell.wallTop;
}

bool WallFlag(const MazeCell& cell, MazeSide side)
{
    switch (side)
    {
        case MazeSide::Top: return cell.wallTop;
        case MazeSide::Right: return cell.wallRight;
        case MazeSide::Bottom: return cell.wallBottom;
        case MazeSide::Left: return cell.wallLeft;
    }
    return true;
}

[[nodiscard]] bool IsExcluded(const std::vector<glm::ivec2>& cells, const glm::ivec2& cell)
{
    return std::find(cells.begin(), cells.end(), cell) != cells.end();
}
} // namespace

glm::ivec2 SideOffset(MazeSide side)
{
    switch (side)
    {
        case MazeSide::Top: return glm::ivec2{0, -1};
        case MazeSide::Right: return glm::ivec2{1, 0};
        case MazeSide::Bottom: return glm::ivec2{0, 1};
        case MazeSide::Left: return glm::ivec2{-1, 0};
    }
    return glm::ivec2{0, 0};
}

MazeSide OppositeSide(MazeSide side)
{
    switch (side)
    {
        case MazeSide::Top: return MazeSide::Bottom;
        case MazeSide::Right: return MazeSide::Left;
        case MazeSide::Bottom: return MazeSide::Top;
        case MazeSide::Left: return MazeSide::Right;
    }
    return side;
}

MazeGraph::MazeGraph(int width, int height)
    : m_width(width)
    , m_height(height)
    , m_cells(static_cast<std::size_t>(width) * static_cast<std::size_t>(height))
{
}

bool MazeGraph::Contains(const glm::ivec2& cell) const
{
    return cell.x >= 0 && cell.y >= 0 && cell.x < m_width && cell.y < m_height;
}

std::size_t MazeGraph::IndexOf(const glm::ivec2& cell) const
{
    return static_cast<std::size_t>(cell.y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(cell.x);
}

const MazeCell& MazeGraph::At(const glm::ivec2& cell) const
{
    return m_cells[IndexOf(cell)];
}

MazeCell& MazeGraph::At(const glm::ivec2& cell)
{
    return m_cells[IndexOf(cell)];
}

bool MazeGraph::HasWall(const glm::ivec2& cell, MazeSide side) const
{
    return WallFlag(At(cell), side);
}

bool MazeGraph::CanMove(const glm::ivec2& cell, MazeSide side) const
{
    if (!Contains(cell) || !Contains(cell + SideOffset(side)))
    {
        return false;
    }
    return !HasWall(cell, side);
}

void MazeGraph::RemoveWallBetween(const glm::ivec2& a, const glm::ivec2& b)
{
    const glm::ivec2 delta = b - a;
    for (MazeSide side : kAllSides)
    {
        if (SideOffset(side) == delta)
        {
            WallFlag(At(a), side) = false;
            WallFlag(At(b), OppositeSide(side)) = false;
            return;
        }
    }
}

int MazeGraph::CountOpenInternalEdges() const
{
    // Each internal edge is counted once, from its left/top cell.
    int open = 0;
    for (int y = 0; y < m_height; ++y)
    {
        for (int x = 0; x < m_width; ++x)
        {
            const glm::ivec2 cell{x, y};
            if (CanMove(cell, MazeSide::Right))
            {
                ++open;
            }
            if (CanMove(cell, MazeSide::Bottom))
            {
                ++open;
            }
        }
    }
    return open;
}

int MazeGraph::CountReachableFrom(const glm::ivec2& start) const
{
    if (!Contains(start))
    {
        return 0;
    }

    std::vector<bool> seen(m_cells.size(), false);
    std::queue<glm::ivec2> frontier;
    frontier.push(start);
    seen[IndexOf(start)] = true;
    int count = 0;

    while (!frontier.empty())
    {
        const glm::ivec2 cell = frontier.front();
        frontier.pop();
        ++count;

        for (MazeSide side : kAllSides)
        {
            if (!CanMove(cell, side))
            {
                continue;
            }
            const glm::ivec2 next = cell + SideOffset(side);
            if (!seen[IndexOf(next)])
            {
                seen[IndexOf(next)] = true;
                frontier.push(next);
            }
        }
    }
    return count;
}

std::vector<glm::ivec2> MazeGraph::FindPath(const glm::ivec2& from, const glm::ivec2& to) const
{
    if (!Contains(from) || !Contains(to))
    {
        return {};
    }

    constexpr int kNoParent = -1;
    std::vector<int> parent(m_cells.size(), kNoParent);
    std::vector<bool> seen(m_cells.size(), false);
    std::queue<glm::ivec2> frontier;
    frontier.push(from);
    seen[IndexOf(from)] = true;

    while (!frontier.empty())
    {
        const glm::ivec2 cell = frontier.front();
        frontier.pop();
        if (cell == to)
        {
            break;
        }

        for (MazeSide side : kAllSides)
        {
            if (!CanMove(cell, side))
            {
                continue;
            }
            const glm::ivec2 next = cell + SideOffset(side);
            const std::size_t nextIndex = IndexOf(next);
            if (!seen[nextIndex])
            {
                seen[nextIndex] = true;
                parent[nextIndex] = static_cast<int>(IndexOf(cell));
                frontier.push(next);
            }
        }
    }

    if (!seen[IndexOf(to)])
    {
        return {};
    }

    std::vector<glm::ivec2> path;
    int index = static_cast<int>(IndexOf(to));
    while (index != kNoParent)
    {
        path.emplace_back(index % m_width, index / m_width);
        index = parent[static_cast<std::size_t>(index)];
    }
    std::reverse(path.begin(), path.end());
    return path;
}

MazeGraph MazeGenerator::Generate(int width, int height, std::mt19937& rng)
{
    if (width < 1 || height < 1)
    {
        throw std::invalid_argument(
            "MazeGenerator: invalid dimensions " + std::to_string(width) + "x" + std::to_string(height));
    }

    MazeGraph maze(width, height);

    std::vector<glm::ivec2> stack;
    stack.reserve(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
    stack.push_back(maze.Entrance());
    maze.At(maze.Entrance()).visited = true;

    std::vector<glm::ivec2> candidates;
    candidates.reserve(4);

    while (!stack.empty())
    {
        const glm::ivec2 current = stack.back();

        candidates.clear();
        for (MazeSide side : kAllSides)
        {
            const glm::ivec2 next = current + SideOffset(side);
            if (maze.Contains(next) && !maze.At(next).visited)
            {
                candidates.push_back(next);
            }
        }

        if (candidates.empty())
        {
            stack.pop_back();
            continue;
        }

        std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
        const glm::ivec2 chosen = candidates[pick(rng)];
        maze.RemoveWallBetween(current, chosen);
        maze.At(chosen).visited = true;
        stack.push_back(chosen);
    }

    maze.At(maze.Entrance()).wallTop = false;
    maze.At(maze.Exit()).wallBottom = false;
    return maze;
}

std::vector<glm::ivec2> MazeGenerator::PlaceObstacles(
    const MazeGraph& maze,
    int obstacleCount,
    std::mt19937& rng,
    const std::vector<glm::ivec2>& reserved)
{
    if (obstacleCount <= 0 || maze.Width() < 3 || maze.Height() < 3)
    {
        return {};
    }

    std::vector<glm::ivec2> excluded = reserved;
    excluded.push_back(maze.Entrance());
    excluded.push_back(maze.Exit());

    return ScatterCells(
        glm::ivec2{1, 1},
        glm::ivec2{maze.Width() - 2, maze.Height() - 2},
        obstacleCount,
        excluded,
        rng);
}

std::vector<glm::ivec2> ScatterCells(
    const glm::ivec2& minCell,
    const glm::ivec2& maxCell,
    int count,
    const std::vector<glm::ivec2>& excluded,
    std::mt19937& rng)
{
    std::vector<glm::ivec2> placed;
    if (count <= 0 || maxCell.x < minCell.x || maxCell.y < minCell.y)
    {
        return placed;
    }

    int freeCells = 0;
    for (int y = minCell.y; y <= maxCell.y; ++y)
    {
        for (int x = minCell.x; x <= maxCell.x; ++x)
        {
            if (!IsExcluded(excluded, glm::ivec2{x, y}))
            {
                ++freeCells;
            }
        }
    }

    int target = count;
    if (target > freeCells)
    {
        std::cout << "MazeGenerator: WARNING - Requested " << count << " obstacles but only "
                  << freeCells << " free cells, clamping\n";
        target = freeCells;
    }

    std::uniform_int_distribution<int> xDist(minCell.x, maxCell.x);
    std::uniform_int_distribution<int> yDist(minCell.y, maxCell.y);
    placed.reserve(static_cast<std::size_t>(target));

    for (int i = 0; i < target; ++i)
    {
        bool found = false;
        for (int attempt = 0; attempt < kMaxScatterAttempts; ++attempt)
        {
            const glm::ivec2 cell{xDist(rng), yDist(rng)};
            if (IsExcluded(excluded, cell) || IsExcluded(placed, cell))
            {
                continue;
            }
            placed.push_back(cell);
            found = true;
            break;
        }

        if (!found)
        {
            std::cout << "MazeGenerator: WARNING - Gave up placing obstacles after " << placed.size()
                      << " of " << count << "\n";
            break;
        }
    }

    return placed;
}
} // namespace game::maps
