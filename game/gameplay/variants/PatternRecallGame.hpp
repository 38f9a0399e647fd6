#pragma once

#include <cstdint>
#include <vector>

#include "game/gameplay/variants/GameVariant.hpp"

namespace game::gameplay
{

struct PatternDifficultyProfile
{
    int baseLength = 2;
    int growEveryRounds = 4;
    int maxLength = 4;
    int scoreMultiplier = 12;
    double stepMilliseconds = 1000.0;
    // Whichever is reached first ends the game with a success.
    int targetScore = 100;
    int roundCap = 8;
};

/// Outcome of one wrong input.
struct ForgivenessDecision
{
    bool consumesLife = true;
    bool reshowsPattern = true;
};

[[nodiscard]] const PatternDifficultyProfile& PatternProfileFor(Difficulty difficulty);

/// min(base + floor(round / growEvery), maxLength)
[[nodiscard]] int PatternLengthForRound(Difficulty difficulty, int round);

/// Policy table keyed by (difficulty, round range).
[[nodiscard]] ForgivenessDecision ForgivenessFor(Difficulty difficulty, int round);

enum class PatternPhase : std::uint8_t
{
    Showing,
    AwaitingInput,
    RoundPause
};

struct PatternRecallState
{
    std::vector<Direction> sequence;
    PatternPhase phase = PatternPhase::Showing;
    int highlightIndex = -1;
    int inputIndex = 0;
    int round = 1;
    int roundsCompleted = 0;
    int score = 0;
    int lives = 3;
    int mistakes = 0;
    int reshows = 0;
};

/// Memory game: a direction sequence is played back one highlighted step at a
/// time, then the player repeats it. Sequences grow with the round number.
class PatternRecallGame final : public GameVariant
{
public:
    PatternRecallGame(const Level& level, engine::core::TimerQueue& timers, std::mt19937& rng);

    [[nodiscard]] Variant Kind() const override { return Variant::PatternRecall; }
    [[nodiscard]] int Score() const override { return m_state.score; }

    [[nodiscard]] const PatternRecallState& GetState() const { return m_state; }
    [[nodiscard]] double PlaybackStepSeconds() const;

    static constexpr int kStartingLives = 3;
    static constexpr double kRoundPauseSeconds = 1.0;

protected:
    void OnStart() override;
    void OnInput(Direction direction) override;
    [[nodiscard]] bool AcceptsInput() const override { return m_state.phase == PatternPhase::AwaitingInput; }

private:
    void BeginRound();
    void ShowPattern();
    void OnPlaybackTick();
    void CompleteRound();
    void HandleMistake();

    PatternRecallState m_state;
    engine::core::TimerId m_playbackTimer = engine::core::kInvalidTimerId;
};

} // namespace game::gameplay
