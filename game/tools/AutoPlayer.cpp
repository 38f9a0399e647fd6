#include "game/tools/AutoPlayer.hpp"

#include <algorithm>

#include "game/gameplay/variants/GridGrowthGame.hpp"
#include "game/gameplay/variants/MazeNavigationGame.hpp"
#include "game/gameplay/variants/PatternRecallGame.hpp"
#include "game/gameplay/variants/RunnerGame.hpp"

namespace game::tools
{
namespace
{
using gameplay::Direction;

std::optional<Direction> DirectionBetween(const glm::ivec2& from, const glm::ivec2& to)
{
    for (Direction direction : gameplay::kAllDirections)
    {
        if (from + gameplay::DirectionOffset(direction) == to)
        {
            return direction;
        }
    }
    return std::nullopt;
}

std::optional<Direction> ChooseMazeMove(const gameplay::MazeNavigationGame& game)
{
    const gameplay::MazeNavigationState& state = game.GetState();
    const std::vector<glm::ivec2> path = state.maze.FindPath(state.player, state.maze.Exit());
    if (path.size() < 2)
    {
        return std::nullopt;
    }
    return DirectionBetween(path[0], path[1]);
}

std::optional<Direction> ChoosePatternInput(const gameplay::PatternRecallGame& game)
{
    const gameplay::PatternRecallState& state = game.GetState();
    if (state.phase != gameplay::PatternPhase::AwaitingInput)
    {
        return std::nullopt;
    }
    if (state.inputIndex < 0 || state.inputIndex >= static_cast<int>(state.sequence.size()))
    {
        return std::nullopt;
    }
    return state.sequence[static_cast<std::size_t>(state.inputIndex)];
}

bool IsSafeGridCell(const gameplay::GridGrowthState& state, const glm::ivec2& cell)
{
    if (!gameplay::GridGrowthGame::InBounds(cell))
    {
        return false;
    }
    // The tail moves away this step unless the head eats.
    const std::size_t checked = cell == state.target ? state.body.size() : state.body.size() - 1;
    for (std::size_t i = 0; i < checked; ++i)
    {
        if (state.body[i] == cell)
        {
            return false;
        }
    }
    return std::find(state.obstacles.begin(), state.obstacles.end(), cell) == state.obstacles.end();
}

std::optional<Direction> ChooseGridTurn(const gameplay::GridGrowthGame& game)
{
    const gameplay::GridGrowthState& state = game.GetState();
    if (state.body.empty())
    {
        return std::nullopt;
    }

    const glm::ivec2 head = state.body.front();
    const glm::ivec2 delta = state.target - head;

    std::vector<Direction> preferred;
    if (delta.x > 0) preferred.push_back(Direction::Right);
    if (delta.x < 0) preferred.push_back(Direction::Left);
    if (delta.y > 0) preferred.push_back(Direction::Down);
    if (delta.y < 0) preferred.push_back(Direction::Up);
    preferred.push_back(state.committed);
    for (Direction direction : gameplay::kAllDirections)
    {
        preferred.push_back(direction);
    }

    for (Direction direction : preferred)
    {
        if (direction == gameplay::Opposite(state.committed))
        {
            continue;
        }
        if (IsSafeGridCell(state, head + gameplay::DirectionOffset(direction)))
        {
            if (direction == state.pending)
            {
                return std::nullopt;
            }
            return direction;
        }
    }
    return std::nullopt;
}

std::optional<Direction> ChooseRunnerDodge(const gameplay::RunnerGame& game)
{
    const gameplay::RunnerState& state = game.GetState();
    constexpr float kLookAhead = 160.0F;
    constexpr float kClearance = gameplay::RunnerGame::kPlayerRadius + 10.0F;

    for (const gameplay::RunnerObstacle& obstacle : state.obstacles)
    {
        const float right = obstacle.position.x + obstacle.size.x;
        if (right < state.player.x - kClearance || obstacle.position.x > state.player.x + kLookAhead)
        {
            continue;
        }

        const float top = obstacle.position.y - kClearance;
        const float bottom = obstacle.position.y + obstacle.size.y + kClearance;
        if (state.player.y < top || state.player.y > bottom)
        {
            continue;
        }

        const float roomAbove = top - gameplay::RunnerGame::kMinY;
        const float roomBelow = gameplay::RunnerGame::kMaxY - bottom;
        return roomAbove >= roomBelow ? Direction::Up : Direction::Down;
    }
    return std::nullopt;
}
} // namespace

std::optional<gameplay::Direction> AutoPlayer::ChooseInput(const gameplay::GameVariant& variant) const
{
    if (!variant.IsActive())
    {
        return std::nullopt;
    }

    switch (variant.Kind())
    {
        case gameplay::Variant::MazeNavigation:
            return ChooseMazeMove(static_cast<const gameplay::MazeNavigationGame&>(variant));
        case gameplay::Variant::PatternRecall:
            return ChoosePatternInput(static_cast<const gameplay::PatternRecallGame&>(variant));
        case gameplay::Variant::GridGrowth:
            return ChooseGridTurn(static_cast<const gameplay::GridGrowthGame&>(variant));
        case gameplay::Variant::Runner:
            return ChooseRunnerDodge(static_cast<const gameplay::RunnerGame&>(variant));
    }
    return std::nullopt;
}
} // namespace game::tools
