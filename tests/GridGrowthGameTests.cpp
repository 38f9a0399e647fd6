#include <gtest/gtest.h>

#include "engine/core/TimerQueue.hpp"
#include "game/gameplay/variants/GridGrowthGame.hpp"

#include <algorithm>
#include <random>

using namespace game::gameplay;

namespace
{
Level MakeGridLevel(int obstacles = 0, float speed = 1.0F)
{
    Level level;
    level.id = 1;
    level.displayName = "Garden";
    level.difficulty = Difficulty::Easy;
    level.speed = speed;
    level.obstacleCount = obstacles;
    level.timeLimitSeconds = 60;
    return level;
}

constexpr double kEpsilon = 1e-6;
} // namespace

class GridGrowthGameTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        game = std::make_unique<GridGrowthGame>(MakeGridLevel(), timers, rng);
        game->SetTerminalCallback([this](int score, bool success) {
            ++terminalCalls;
            lastScore = score;
            lastSuccess = success;
        });
        game->Start();
    }

    void Steps(int count)
    {
        timers.Advance(game->StepIntervalSeconds() * count + kEpsilon);
    }

    engine::core::TimerQueue timers;
    std::mt19937 rng{99};
    std::unique_ptr<GridGrowthGame> game;
    int terminalCalls = 0;
    int lastScore = -1;
    bool lastSuccess = false;
};

TEST_F(GridGrowthGameTest, StartsWithThreeCellsHeadingRight)
{
    const GridGrowthState& state = game->GetState();
    ASSERT_EQ(state.body.size(), 3U);
    EXPECT_EQ(state.body.front(), glm::ivec2(10, 10));
    EXPECT_EQ(state.committed, Direction::Right);
    EXPECT_EQ(state.target, glm::ivec2(15, 10));
    EXPECT_DOUBLE_EQ(game->StepIntervalSeconds(), 0.3);
}

TEST_F(GridGrowthGameTest, MovesOneCellPerStep)
{
    Steps(1);
    EXPECT_EQ(game->GetState().body.front(), glm::ivec2(11, 10));
    EXPECT_EQ(game->GetState().body.back(), glm::ivec2(9, 10));
    EXPECT_EQ(game->GetState().body.size(), 3U);
}

TEST_F(GridGrowthGameTest, ReverseTurnNeverChangesDirection)
{
    EXPECT_TRUE(game->HandleInput(Direction::Left, 0.0));
    EXPECT_EQ(game->GetState().pending, Direction::Right);
    EXPECT_EQ(game->GetState().rejectedTurns, 1);

    Steps(1);
    EXPECT_EQ(game->GetState().committed, Direction::Right);
    EXPECT_TRUE(game->IsActive());
}

TEST_F(GridGrowthGameTest, QuickDoubleTurnCannotFoldBack)
{
    // Up is legal, but Left is still the reverse of the committed Right.
    (void)game->HandleInput(Direction::Up, 0.0);
    (void)game->HandleInput(Direction::Left, 50.0);
    EXPECT_EQ(game->GetState().pending, Direction::Up);

    Steps(1);
    EXPECT_EQ(game->GetState().body.front(), glm::ivec2(10, 9));
    EXPECT_TRUE(game->IsActive());
}

TEST_F(GridGrowthGameTest, EatingGrowsAndRelocatesTarget)
{
    Steps(5);
    const GridGrowthState& state = game->GetState();
    EXPECT_EQ(state.body.front(), glm::ivec2(15, 10));
    EXPECT_EQ(state.body.size(), 4U);
    EXPECT_EQ(game->Score(), GridGrowthGame::kPointsPerTarget);
    EXPECT_EQ(std::find(state.body.begin(), state.body.end(), state.target), state.body.end());
    EXPECT_TRUE(GridGrowthGame::InBounds(state.target));
}

TEST_F(GridGrowthGameTest, LeavingGridFails)
{
    ASSERT_TRUE(game->SetTarget(glm::ivec2(0, 0)));
    Steps(30);
    EXPECT_EQ(game->Phase(), VariantPhase::Failed);
    EXPECT_EQ(terminalCalls, 1);
    EXPECT_FALSE(lastSuccess);
    EXPECT_EQ(game->OwnedTimerCount(), 0U);
}

TEST_F(GridGrowthGameTest, RunningIntoBodyFails)
{
    ASSERT_TRUE(game->SetTarget(glm::ivec2(11, 10)));
    Steps(1);
    ASSERT_TRUE(game->SetTarget(glm::ivec2(12, 10)));
    Steps(1);
    ASSERT_EQ(game->GetState().body.size(), 5U);
    ASSERT_TRUE(game->SetTarget(glm::ivec2(30, 20)));

    (void)game->HandleInput(Direction::Down, 0.0);
    Steps(1);
    (void)game->HandleInput(Direction::Left, 100.0);
    Steps(1);
    (void)game->HandleInput(Direction::Up, 200.0);
    Steps(1);

    EXPECT_EQ(game->Phase(), VariantPhase::Failed);
    EXPECT_EQ(lastScore, 2 * GridGrowthGame::kPointsPerTarget);
}

TEST_F(GridGrowthGameTest, FollowingTheTailIsSafe)
{
    ASSERT_TRUE(game->SetTarget(glm::ivec2(11, 10)));
    Steps(1);
    ASSERT_TRUE(game->SetTarget(glm::ivec2(30, 20)));
    const glm::ivec2 tail = game->GetState().body.back();

    (void)game->HandleInput(Direction::Down, 0.0);
    Steps(1);
    (void)game->HandleInput(Direction::Left, 0.0);
    Steps(1);
    (void)game->HandleInput(Direction::Up, 0.0);
    Steps(1);

    // The head took the cell the tail vacated in the same step.
    EXPECT_TRUE(game->IsActive());
    EXPECT_EQ(game->GetState().body.front(), tail + glm::ivec2(2, 0));
}

TEST_F(GridGrowthGameTest, TenTargetsWin)
{
    for (int eaten = 0; eaten < 10 && game->IsActive(); ++eaten)
    {
        const glm::ivec2 head = game->GetState().body.front();
        ASSERT_TRUE(game->SetTarget(head + DirectionOffset(game->GetState().committed)));
        Steps(1);
    }
    EXPECT_EQ(game->Phase(), VariantPhase::Succeeded);
    EXPECT_EQ(lastScore, 100);
    EXPECT_TRUE(lastSuccess);
}

TEST_F(GridGrowthGameTest, EnteringObstacleFails)
{
    ASSERT_TRUE(game->PlaceObstacle(glm::ivec2{12, 10}));
    EXPECT_FALSE(game->PlaceObstacle(glm::ivec2{12, 10}));
    EXPECT_FALSE(game->PlaceObstacle(game->GetState().target));
    EXPECT_FALSE(game->PlaceObstacle(glm::ivec2{9, 10}));

    Steps(1);
    EXPECT_TRUE(game->IsActive());
    EXPECT_EQ(game->GetState().body.front(), glm::ivec2(11, 10));

    Steps(1);
    EXPECT_EQ(game->Phase(), VariantPhase::Failed);
    EXPECT_EQ(terminalCalls, 1);
    EXPECT_FALSE(lastSuccess);
    EXPECT_EQ(lastScore, 0);
    EXPECT_EQ(game->GetState().body.front(), glm::ivec2(11, 10));
    EXPECT_EQ(game->OwnedTimerCount(), 0U);

    Steps(3);
    EXPECT_EQ(terminalCalls, 1);
}

TEST(GridGrowthObstacleTest, ObstaclesAvoidBodyAndTarget)
{
    engine::core::TimerQueue timers;
    std::mt19937 rng(5);
    GridGrowthGame game(MakeGridLevel(5, 2.0F), timers, rng);
    game.Start();

    const GridGrowthState& state = game.GetState();
    EXPECT_EQ(state.obstacles.size(), 5U);
    for (const glm::ivec2& cell : state.obstacles)
    {
        EXPECT_TRUE(GridGrowthGame::InBounds(cell));
        EXPECT_EQ(std::find(state.body.begin(), state.body.end(), cell), state.body.end());
        EXPECT_NE(cell, state.target);
    }
    EXPECT_DOUBLE_EQ(game.StepIntervalSeconds(), 0.15);
}
