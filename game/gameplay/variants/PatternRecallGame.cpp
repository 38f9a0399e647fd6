#include "game/gameplay/variants/PatternRecallGame.hpp"

#include <algorithm>

namespace game::gameplay
{
namespace
{
const PatternDifficultyProfile kEasyProfile{2, 4, 4, 12, 1000.0, 100, 8};
const PatternDifficultyProfile kMediumProfile{3, 3, 6, 15, 800.0, 250, 4};
const PatternDifficultyProfile kHardProfile{4, 2, 8, 20, 600.0, 300, 12};

struct ForgivenessRule
{
    Difficulty difficulty;
    int firstRound;
    int lastRound; // inclusive, 0 = open ended
    ForgivenessDecision decision;
};

// First matching row wins.
const ForgivenessRule kForgivenessTable[] = {
    {Difficulty::Easy, 1, 3, {false, true}},
    {Difficulty::Easy, 4, 0, {true, true}},
    {Difficulty::Medium, 1, 1, {false, true}},
    {Difficulty::Medium, 2, 0, {true, true}},
    {Difficulty::Hard, 1, 0, {true, false}},
};
} // namespace

const PatternDifficultyProfile& PatternProfileFor(Difficulty difficulty)
{
    switch (difficulty)
    {
        case Difficulty::Easy: return kEasyProfile;
        case Difficulty::Medium: return kMediumProfile;
        case Difficulty::Hard: return kHardProfile;
    }
    return kEasyProfile;
}

int PatternLengthForRound(Difficulty difficulty, int round)
{
    const PatternDifficultyProfile& profile = PatternProfileFor(difficulty);
    const int grow = std::max(round, 0) / std::max(profile.growEveryRounds, 1);
    return std::min(profile.baseLength + grow, profile.maxLength);
}

ForgivenessDecision ForgivenessFor(Difficulty difficulty, int round)
{
    for (const ForgivenessRule& rule : kForgivenessTable)
    {
        if (rule.difficulty != difficulty || round < rule.firstRound)
        {
            continue;
        }
        if (rule.lastRound == 0 || round <= rule.lastRound)
        {
            return rule.decision;
        }
    }
    return ForgivenessDecision{};
}

PatternRecallGame::PatternRecallGame(const Level& level, engine::core::TimerQueue& timers, std::mt19937& rng)
    : GameVariant(level, timers, rng)
{
}

double PatternRecallGame::PlaybackStepSeconds() const
{
    const float speed = std::max(GetLevel().speed, 0.1F);
    return PatternProfileFor(GetLevel().difficulty).stepMilliseconds / 1000.0 / static_cast<double>(speed);
}

void PatternRecallGame::OnStart()
{
    m_state = PatternRecallState{};
    m_state.lives = kStartingLives;
    BeginRound();
}

void PatternRecallGame::BeginRound()
{
    const int length = PatternLengthForRound(GetLevel().difficulty, m_state.round);
    std::uniform_int_distribution<std::size_t> pick(0, kAllDirections.size() - 1);

    m_state.sequence.clear();
    for (int i = 0; i < length; ++i)
    {
        m_state.sequence.push_back(kAllDirections[pick(Rng())]);
    }
    ShowPattern();
}

void PatternRecallGame::ShowPattern()
{
    m_state.phase = PatternPhase::Showing;
    m_state.highlightIndex = -1;
    m_state.inputIndex = 0;
    StopTimer(m_playbackTimer);
    m_playbackTimer = StartPeriodicTimer(PlaybackStepSeconds(), [this]() { OnPlaybackTick(); });
}

void PatternRecallGame::OnPlaybackTick()
{
    if (!IsActive())
    {
        return;
    }

    const int next = m_state.highlightIndex + 1;
    if (next < static_cast<int>(m_state.sequence.size()))
    {
        m_state.highlightIndex = next;
        return;
    }

    StopTimer(m_playbackTimer);
    m_state.highlightIndex = -1;
    m_state.phase = PatternPhase::AwaitingInput;
}

void PatternRecallGame::OnInput(Direction direction)
{
    if (m_state.inputIndex >= static_cast<int>(m_state.sequence.size()))
    {
        return;
    }

    if (direction != m_state.sequence[static_cast<std::size_t>(m_state.inputIndex)])
    {
        HandleMistake();
        return;
    }

    ++m_state.inputIndex;
    if (m_state.inputIndex >= static_cast<int>(m_state.sequence.size()))
    {
        CompleteRound();
    }
}

void PatternRecallGame::CompleteRound()
{
    const PatternDifficultyProfile& profile = PatternProfileFor(GetLevel().difficulty);
    m_state.score += profile.scoreMultiplier * static_cast<int>(m_state.sequence.size());
    ++m_state.roundsCompleted;

    if (m_state.score >= profile.targetScore || m_state.roundsCompleted >= profile.roundCap)
    {
        Finish(m_state.score, true);
        return;
    }

    m_state.phase = PatternPhase::RoundPause;
    ++m_state.round;
    StartOneShotTimer(kRoundPauseSeconds, [this]() {
        if (IsActive())
        {
            BeginRound();
        }
    });
}

void PatternRecallGame::HandleMistake()
{
    ++m_state.mistakes;
    const ForgivenessDecision decision = ForgivenessFor(GetLevel().difficulty, m_state.round);

    if (decision.consumesLife)
    {
        --m_state.lives;
        if (m_state.lives <= 0)
        {
            m_state.lives = 0;
            Finish(m_state.score, false);
            return;
        }
    }

    if (decision.reshowsPattern)
    {
        ++m_state.reshows;
        ShowPattern();
    }
}

} // namespace game::gameplay
