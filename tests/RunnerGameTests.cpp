#include <gtest/gtest.h>

#include "engine/core/TimerQueue.hpp"
#include "game/gameplay/variants/RunnerGame.hpp"

#include <random>

using namespace game::gameplay;

namespace
{
Level MakeRunnerLevel(int obstacles = 5, float speed = 1.0F, int timeLimit = 60)
{
    Level level;
    level.id = 1;
    level.displayName = "Test Run";
    level.difficulty = Difficulty::Easy;
    level.speed = speed;
    level.obstacleCount = obstacles;
    level.timeLimitSeconds = timeLimit;
    return level;
}

struct Outcome
{
    int calls = 0;
    int score = -1;
    bool success = false;
};
} // namespace

class RunnerGameTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        game = std::make_unique<RunnerGame>(MakeRunnerLevel(), timers, rng);
        game->SetTerminalCallback([this](int score, bool success) {
            ++outcome.calls;
            outcome.score = score;
            outcome.success = success;
        });
    }

    engine::core::TimerQueue timers;
    std::mt19937 rng{42};
    Outcome outcome;
    std::unique_ptr<RunnerGame> game;
};

TEST_F(RunnerGameTest, DerivesPacingFromLevel)
{
    EXPECT_EQ(game->SpawnChancePercent(), 50);
    EXPECT_DOUBLE_EQ(game->SpawnIntervalSeconds(), 1.5);
    EXPECT_FLOAT_EQ(game->SlideSpeedPerStep(), 3.0F);

    RunnerGame crowded(MakeRunnerLevel(12, 2.0F), timers, rng);
    EXPECT_EQ(crowded.SpawnChancePercent(), 30);
    EXPECT_DOUBLE_EQ(crowded.SpawnIntervalSeconds(), 0.75);
    EXPECT_FLOAT_EQ(crowded.SlideSpeedPerStep(), 6.0F);
}

TEST_F(RunnerGameTest, ScoreIsCappedAtOneHundred)
{
    game->Start();
    for (int i = 0; i < 999; ++i)
    {
        game->FixedUpdate(1.0 / 60.0);
    }
    EXPECT_EQ(game->Score(), 99);
    EXPECT_TRUE(game->IsActive());

    game->FixedUpdate(1.0 / 60.0);
    EXPECT_EQ(game->Score(), 100);
    EXPECT_EQ(game->Phase(), VariantPhase::Succeeded);
    EXPECT_EQ(outcome.calls, 1);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.score, 100);

    for (int i = 0; i < 500; ++i)
    {
        game->FixedUpdate(1.0 / 60.0);
    }
    EXPECT_EQ(game->Score(), 100);
    EXPECT_EQ(outcome.calls, 1);
    EXPECT_EQ(game->OwnedTimerCount(), 0U);
}

TEST_F(RunnerGameTest, CollisionFails)
{
    game->Start();
    game->SpawnObstacle(200.0F, 100.0F);

    for (int i = 0; i < 400 && game->IsActive(); ++i)
    {
        game->FixedUpdate(1.0 / 60.0);
    }
    EXPECT_EQ(game->Phase(), VariantPhase::Failed);
    EXPECT_EQ(outcome.calls, 1);
    EXPECT_FALSE(outcome.success);
    EXPECT_LT(outcome.score, 100);
}

TEST_F(RunnerGameTest, DodgingAvoidsCollision)
{
    game->Start();
    game->SpawnObstacle(200.0F, 100.0F);
    for (int i = 0; i < 10; ++i)
    {
        EXPECT_TRUE(game->HandleInput(Direction::Up, 100.0 * i));
    }
    EXPECT_FLOAT_EQ(game->GetState().player.y, 100.0F);

    for (int i = 0; i < 400; ++i)
    {
        game->FixedUpdate(1.0 / 60.0);
    }
    EXPECT_TRUE(game->IsActive());
    EXPECT_TRUE(game->GetState().obstacles.empty());
}

TEST_F(RunnerGameTest, PlayerStaysInsideField)
{
    game->Start();
    for (int i = 0; i < 100; ++i)
    {
        (void)game->HandleInput(Direction::Up, i);
        (void)game->HandleInput(Direction::Left, i);
    }
    EXPECT_FLOAT_EQ(game->GetState().player.x, RunnerGame::kMinX);
    EXPECT_FLOAT_EQ(game->GetState().player.y, RunnerGame::kMinY);
}

TEST_F(RunnerGameTest, CountdownExpiryFails)
{
    RunnerGame shortRun(MakeRunnerLevel(0, 1.0F, 2), timers, rng);
    int calls = 0;
    bool success = true;
    shortRun.SetTerminalCallback([&](int, bool ok) {
        ++calls;
        success = ok;
    });

    shortRun.Start();
    timers.Advance(1.0);
    EXPECT_EQ(shortRun.TimeRemainingSeconds(), 1);
    EXPECT_TRUE(shortRun.IsActive());

    timers.Advance(1.0);
    EXPECT_EQ(shortRun.Phase(), VariantPhase::Failed);
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(success);
    EXPECT_EQ(shortRun.OwnedTimerCount(), 0U);
}

TEST_F(RunnerGameTest, SpawnTimerAddsObstacles)
{
    RunnerGame busy(MakeRunnerLevel(0), timers, rng);
    busy.Start();
    timers.Advance(1.6);
    ASSERT_EQ(busy.GetState().obstacles.size(), 1U);

    const RunnerObstacle& obstacle = busy.GetState().obstacles.front();
    EXPECT_FLOAT_EQ(obstacle.position.x, kFieldWidth);
    EXPECT_GE(obstacle.size.y, 50.0F);
    EXPECT_LE(obstacle.size.y, 199.0F);
    EXPECT_LT(obstacle.position.y + obstacle.size.y, kFieldHeight);
}

TEST_F(RunnerGameTest, ReportsReactionLatencies)
{
    std::vector<double> latencies;
    game->SetReactionCallback([&latencies](double ms) { latencies.push_back(ms); });
    game->Start();

    (void)game->HandleInput(Direction::Down, 1000.0);
    (void)game->HandleInput(Direction::Down, 1300.0);
    (void)game->HandleInput(Direction::Up, 1750.0);
    EXPECT_EQ(latencies, (std::vector<double>{300.0, 450.0}));
}

TEST_F(RunnerGameTest, RefusesInputWhenNotActive)
{
    EXPECT_FALSE(game->HandleInput(Direction::Up, 0.0));
    game->Start();
    game->Stop();
    EXPECT_FALSE(game->HandleInput(Direction::Up, 0.0));
    EXPECT_EQ(game->OwnedTimerCount(), 0U);
    EXPECT_EQ(outcome.calls, 0);
}

TEST(RunnerOverlapTest, AxisAlignedOverlap)
{
    RunnerObstacle obstacle;
    obstacle.position = glm::vec2{100.0F, 100.0F};
    obstacle.size = glm::vec2{30.0F, 100.0F};

    EXPECT_TRUE(RunnerGame::Overlaps(glm::vec2{90.0F, 150.0F}, obstacle));
    EXPECT_FALSE(RunnerGame::Overlaps(glm::vec2{80.0F, 150.0F}, obstacle));
    EXPECT_FALSE(RunnerGame::Overlaps(glm::vec2{115.0F, 80.0F}, obstacle));
    EXPECT_TRUE(RunnerGame::Overlaps(glm::vec2{115.0F, 81.0F}, obstacle));
}
