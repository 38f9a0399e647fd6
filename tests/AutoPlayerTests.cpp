#include <gtest/gtest.h>

#include "engine/core/TimerQueue.hpp"
#include "game/gameplay/variants/GridGrowthGame.hpp"
#include "game/gameplay/variants/RunnerGame.hpp"
#include "game/tools/AutoPlayer.hpp"

#include <random>

using namespace game::gameplay;

namespace
{
Level MakeLevel(int obstacles)
{
    Level level;
    level.displayName = "Bot";
    level.obstacleCount = obstacles;
    level.timeLimitSeconds = 60;
    return level;
}
} // namespace

TEST(AutoPlayerTest, IdleVariantGetsNoInput)
{
    engine::core::TimerQueue timers;
    std::mt19937 rng(1);
    RunnerGame runner(MakeLevel(0), timers, rng);
    const game::tools::AutoPlayer bot;
    EXPECT_FALSE(bot.ChooseInput(runner).has_value());
}

TEST(AutoPlayerTest, RunnerBotDodgesObstacleAhead)
{
    engine::core::TimerQueue timers;
    std::mt19937 rng(1);
    RunnerGame runner(MakeLevel(0), timers, rng);
    const game::tools::AutoPlayer bot;

    runner.Start();
    runner.SpawnObstacle(200.0F, 100.0F);
    for (int step = 0; step < 400 && runner.IsActive(); ++step)
    {
        if (const auto input = bot.ChooseInput(runner))
        {
            EXPECT_TRUE(runner.HandleInput(*input, step * 16.0));
        }
        runner.FixedUpdate(1.0 / 60.0);
    }

    EXPECT_TRUE(runner.IsActive());
    EXPECT_TRUE(runner.GetState().obstacles.empty());
}

TEST(AutoPlayerTest, GridBotNeverReverses)
{
    engine::core::TimerQueue timers;
    std::mt19937 rng(8);
    GridGrowthGame grid(MakeLevel(4), timers, rng);
    const game::tools::AutoPlayer bot;

    grid.Start();
    for (int step = 0; step < 100 && grid.IsActive(); ++step)
    {
        if (const auto input = bot.ChooseInput(grid))
        {
            EXPECT_NE(*input, Opposite(grid.GetState().committed));
            EXPECT_TRUE(grid.HandleInput(*input, step * 300.0));
        }
        timers.Advance(grid.StepIntervalSeconds() + 1e-6);
    }

    EXPECT_EQ(grid.GetState().rejectedTurns, 0);
    EXPECT_GE(grid.Score(), 10);
}
