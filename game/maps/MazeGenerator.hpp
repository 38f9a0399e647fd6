#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include <glm/vec2.hpp>

namespace game::maps
{
enum class MazeSide : std::uint8_t
{
    Top,
    Right,
    Bottom,
    Left
};

struct MazeCell
{
    bool wallTop = true;
    bool wallRight = true;
    bool wallBottom = true;
    bool wallLeft = true;
    bool visited = false;
};

/// Rectangular grid of cells with four wall flags each.
/// Cell (0,0) is the entrance (top-left), (width-1, height-1) the exit.
class MazeGraph
{
public:
    MazeGraph() = default;
    MazeGraph(int width, int height);

    [[nodiscard]] int Width() const { return m_width; }
    [[nodiscard]] int Height() const { return m_height; }
    [[nodiscard]] glm::ivec2 Entrance() const { return glm::ivec2{0, 0}; }
    [[nodiscard]] glm::ivec2 Exit() const { return glm::ivec2{m_width - 1, m_height - 1}; }

    [[nodiscard]] bool Contains(const glm::ivec2& cell) const;
    [[nodiscard]] const MazeCell& At(const glm::ivec2& cell) const;
    MazeCell& At(const glm::ivec2& cell);

    [[nodiscard]] bool HasWall(const glm::ivec2& cell, MazeSide side) const;

    /// True if the neighbor across `side` exists and no wall separates them.
    [[nodiscard]] bool CanMove(const glm::ivec2& cell, MazeSide side) const;

    /// Clears the shared wall of two orthogonally adjacent cells.
    void RemoveWallBetween(const glm::ivec2& a, const glm::ivec2& b);

    /// Number of open walls between pairs of in-grid cells.
    [[nodiscard]] int CountOpenInternalEdges() const;
    [[nodiscard]] int CountReachableFrom(const glm::ivec2& start) const;

    /// Shortest open path from `from` to `to`, both inclusive. Empty when unreachable.
    [[nodiscard]] std::vector<glm::ivec2> FindPath(const glm::ivec2& from, const glm::ivec2& to) const;

private:
    [[nodiscard]] std::size_t IndexOf(const glm::ivec2& cell) const;

    int m_width = 0;
    int m_height = 0;
    std::vector<MazeCell> m_cells;
};

[[nodiscard]] glm::ivec2 SideOffset(MazeSide side);
[[nodiscard]] MazeSide OppositeSide(MazeSide side);

class MazeGenerator
{
public:
    /// Randomized depth-first backtracking from the entrance. Produces a
    /// spanning tree of the grid graph, then opens the entrance's top wall
    /// and the exit's bottom wall to the outside.
    /// @throws std::invalid_argument if width or height is below 1.
    [[nodiscard]] static MazeGraph Generate(int width, int height, std::mt19937& rng);

    /// Picks distinct interior cells (x in [1, w-2], y in [1, h-2]) for
    /// obstacles, never the entrance, the exit or any cell in `reserved`.
    [[nodiscard]] static std::vector<glm::ivec2> PlaceObstacles(
        const MazeGraph& maze,
        int obstacleCount,
        std::mt19937& rng,
        const std::vector<glm::ivec2>& reserved = {});
};

/// Rejection-samples `count` distinct cells inside [minCell, maxCell], skipping
/// `excluded`. Each cell gets kMaxScatterAttempts draws; when those run out the
/// result is shorter than requested.
[[nodiscard]] std::vector<glm::ivec2> ScatterCells(
    const glm::ivec2& minCell,
    const glm::ivec2& maxCell,
    int count,
    const std::vector<glm::ivec2>& excluded,
    std::mt19937& rng);

constexpr int kMaxScatterAttempts = 64;
} // namespace game::maps
