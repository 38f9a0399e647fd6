#include <gtest/gtest.h>

#include "engine/core/TimerQueue.hpp"
#include "game/gameplay/variants/PatternRecallGame.hpp"

#include <random>

using namespace game::gameplay;

namespace
{
Level MakePatternLevel(Difficulty difficulty, float speed = 1.0F, int timeLimit = 45)
{
    Level level;
    level.id = 1;
    level.displayName = "Pattern";
    level.difficulty = difficulty;
    level.speed = speed;
    level.timeLimitSeconds = timeLimit;
    return level;
}

Direction WrongFor(Direction expected)
{
    return expected == Direction::Up ? Direction::Down : Direction::Up;
}
} // namespace

class PatternRecallGameTest : public ::testing::Test
{
protected:
    void Create(Difficulty difficulty)
    {
        game = std::make_unique<PatternRecallGame>(MakePatternLevel(difficulty), timers, rng);
        game->SetTerminalCallback([this](int score, bool success) {
            ++terminalCalls;
            lastScore = score;
            lastSuccess = success;
        });
    }

    /// Runs the playback until the game waits for input.
    void FinishPlayback()
    {
        const double step = game->PlaybackStepSeconds();
        for (int i = 0; i < 20 && game->GetState().phase != PatternPhase::AwaitingInput; ++i)
        {
            timers.Advance(step);
        }
        ASSERT_EQ(game->GetState().phase, PatternPhase::AwaitingInput);
    }

    void EnterSequence()
    {
        const std::vector<Direction> sequence = game->GetState().sequence;
        for (Direction direction : sequence)
        {
            clockMs += 400.0;
            EXPECT_TRUE(game->HandleInput(direction, clockMs));
        }
    }

    engine::core::TimerQueue timers;
    std::mt19937 rng{1234};
    std::unique_ptr<PatternRecallGame> game;
    int terminalCalls = 0;
    int lastScore = -1;
    bool lastSuccess = false;
    double clockMs = 0.0;
};

TEST(PatternPolicyTest, LengthGrowsAndClamps)
{
    EXPECT_EQ(PatternLengthForRound(Difficulty::Easy, 1), 2);
    EXPECT_EQ(PatternLengthForRound(Difficulty::Easy, 4), 3);
    EXPECT_EQ(PatternLengthForRound(Difficulty::Easy, 8), 4);
    EXPECT_EQ(PatternLengthForRound(Difficulty::Easy, 40), 4);
    EXPECT_EQ(PatternLengthForRound(Difficulty::Medium, 1), 3);
    EXPECT_EQ(PatternLengthForRound(Difficulty::Medium, 3), 4);
    EXPECT_EQ(PatternLengthForRound(Difficulty::Hard, 2), 5);
    EXPECT_EQ(PatternLengthForRound(Difficulty::Hard, 100), 8);
}

TEST(PatternPolicyTest, ForgivenessTable)
{
    for (int round = 1; round <= 3; ++round)
    {
        const ForgivenessDecision easyEarly = ForgivenessFor(Difficulty::Easy, round);
        EXPECT_FALSE(easyEarly.consumesLife);
        EXPECT_TRUE(easyEarly.reshowsPattern);
    }
    EXPECT_TRUE(ForgivenessFor(Difficulty::Easy, 4).consumesLife);
    EXPECT_TRUE(ForgivenessFor(Difficulty::Easy, 4).reshowsPattern);

    EXPECT_FALSE(ForgivenessFor(Difficulty::Medium, 1).consumesLife);
    EXPECT_TRUE(ForgivenessFor(Difficulty::Medium, 2).consumesLife);

    const ForgivenessDecision hard = ForgivenessFor(Difficulty::Hard, 1);
    EXPECT_TRUE(hard.consumesLife);
    EXPECT_FALSE(hard.reshowsPattern);
}

TEST_F(PatternRecallGameTest, PlaybackHighlightsEachStepThenWaits)
{
    Create(Difficulty::Easy);
    game->Start();
    EXPECT_EQ(game->GetState().phase, PatternPhase::Showing);
    EXPECT_FALSE(game->HandleInput(Direction::Up, 0.0));

    timers.Advance(1.0);
    EXPECT_EQ(game->GetState().highlightIndex, 0);
    timers.Advance(1.0);
    EXPECT_EQ(game->GetState().highlightIndex, 1);
    timers.Advance(1.0);
    EXPECT_EQ(game->GetState().phase, PatternPhase::AwaitingInput);
    EXPECT_EQ(game->GetState().highlightIndex, -1);
}

TEST_F(PatternRecallGameTest, EasyFirstRoundScoresTwentyFour)
{
    Create(Difficulty::Easy);
    game->Start();
    ASSERT_EQ(game->GetState().sequence.size(), 2U);

    FinishPlayback();
    EnterSequence();

    EXPECT_EQ(game->Score(), 24);
    EXPECT_EQ(game->GetState().roundsCompleted, 1);
    EXPECT_EQ(game->GetState().round, 2);
    EXPECT_EQ(game->GetState().phase, PatternPhase::RoundPause);
    EXPECT_TRUE(game->IsActive());

    timers.Advance(PatternRecallGame::kRoundPauseSeconds);
    EXPECT_EQ(game->GetState().phase, PatternPhase::Showing);
    EXPECT_EQ(game->GetState().sequence.size(), 2U);
}

TEST_F(PatternRecallGameTest, EasyEarlyMistakeReshowsWithoutLosingLife)
{
    Create(Difficulty::Easy);
    game->Start();
    FinishPlayback();

    const Direction expected = game->GetState().sequence.front();
    EXPECT_TRUE(game->HandleInput(WrongFor(expected), 100.0));

    EXPECT_EQ(game->GetState().lives, PatternRecallGame::kStartingLives);
    EXPECT_EQ(game->GetState().reshows, 1);
    EXPECT_EQ(game->GetState().phase, PatternPhase::Showing);
    EXPECT_EQ(game->GetState().inputIndex, 0);
    EXPECT_TRUE(game->IsActive());
}

TEST_F(PatternRecallGameTest, HardMistakeCostsLifeAndKeepsPosition)
{
    Create(Difficulty::Hard);
    game->Start();
    FinishPlayback();

    const Direction first = game->GetState().sequence[0];
    EXPECT_TRUE(game->HandleInput(first, 100.0));
    const Direction second = game->GetState().sequence[1];
    EXPECT_TRUE(game->HandleInput(WrongFor(second), 200.0));

    EXPECT_EQ(game->GetState().lives, 2);
    EXPECT_EQ(game->GetState().inputIndex, 1);
    EXPECT_EQ(game->GetState().phase, PatternPhase::AwaitingInput);
}

TEST_F(PatternRecallGameTest, LosingAllLivesFails)
{
    Create(Difficulty::Hard);
    game->Start();
    FinishPlayback();

    const Direction wrong = WrongFor(game->GetState().sequence.front());
    for (int i = 0; i < 3; ++i)
    {
        (void)game->HandleInput(wrong, 100.0 * i);
    }

    EXPECT_EQ(game->Phase(), VariantPhase::Failed);
    EXPECT_EQ(game->GetState().lives, 0);
    EXPECT_EQ(terminalCalls, 1);
    EXPECT_FALSE(lastSuccess);
    EXPECT_EQ(game->OwnedTimerCount(), 0U);
}

TEST_F(PatternRecallGameTest, ReachingTargetScoreSucceeds)
{
    Create(Difficulty::Easy);
    game->Start();

    for (int round = 0; round < 8 && game->IsActive(); ++round)
    {
        FinishPlayback();
        EnterSequence();
        if (game->IsActive())
        {
            timers.Advance(PatternRecallGame::kRoundPauseSeconds);
        }
    }

    EXPECT_EQ(game->Phase(), VariantPhase::Succeeded);
    EXPECT_EQ(terminalCalls, 1);
    EXPECT_TRUE(lastSuccess);
    EXPECT_GE(lastScore, PatternProfileFor(Difficulty::Easy).targetScore);
    EXPECT_EQ(game->GetState().roundsCompleted, 4);
}

TEST_F(PatternRecallGameTest, MediumEndsAtRoundCapBelowTarget)
{
    Create(Difficulty::Medium);
    game->Start();

    // 45 + 45 + 60 + 60: four rounds stop the game before the target of 250.
    for (int round = 0; round < 10 && game->IsActive(); ++round)
    {
        FinishPlayback();
        EnterSequence();
        if (game->IsActive())
        {
            timers.Advance(PatternRecallGame::kRoundPauseSeconds);
        }
    }

    const PatternDifficultyProfile& profile = PatternProfileFor(Difficulty::Medium);
    EXPECT_EQ(game->Phase(), VariantPhase::Succeeded);
    EXPECT_EQ(terminalCalls, 1);
    EXPECT_TRUE(lastSuccess);
    EXPECT_EQ(game->GetState().roundsCompleted, profile.roundCap);
    EXPECT_EQ(lastScore, 210);
    EXPECT_LT(lastScore, profile.targetScore);
    EXPECT_EQ(game->OwnedTimerCount(), 0U);
}

TEST_F(PatternRecallGameTest, PlaybackPaceScalesWithSpeed)
{
    PatternRecallGame fast(MakePatternLevel(Difficulty::Medium, 2.0F), timers, rng);
    EXPECT_DOUBLE_EQ(fast.PlaybackStepSeconds(), 0.4);
}
