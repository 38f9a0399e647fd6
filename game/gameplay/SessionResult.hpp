#pragma once

#include <string>
#include <vector>

#include "engine/core/CalendarDate.hpp"
#include "game/gameplay/EmotionScoring.hpp"
#include "game/gameplay/GameTypes.hpp"

namespace game::gameplay
{
/// Produced exactly once per successful attempt; immutable afterwards.
struct SessionResult
{
    std::string childId;
    Variant variant = Variant::Runner;
    int levelId = 1;
    int score = 0;
    double completionTimeSeconds = 0.0;
    int retryCount = 0;
    double successRate = 0.0;
    std::vector<double> reactionSamplesMs;
    EmotionScore emotion;
    Sentiment sentiment = Sentiment::Neutral;
    engine::core::CalendarDate playedOn;
};
} // namespace game::gameplay
