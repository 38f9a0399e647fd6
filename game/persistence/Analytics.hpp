#pragma once

#include <string>
#include <vector>

#include "engine/core/CalendarDate.hpp"
#include "game/gameplay/EmotionScoring.hpp"
#include "game/persistence/ProfileStore.hpp"

namespace game::persistence
{
struct LeaderboardEntry
{
    std::string childId;
    int totalScore = 0;
    int sessions = 0;
    int rank = 0;
};

struct EmotionTrendPoint
{
    engine::core::CalendarDate date;
    gameplay::EmotionScore average;
    int sessions = 0;
};

/// Total score per child, highest first, ranks from 1. Ties keep child id order.
/// Children listed in `knownChildren` without results appear with zero.
[[nodiscard]] std::vector<LeaderboardEntry> BuildLeaderboard(
    const std::vector<gameplay::SessionResult>& results,
    const std::vector<std::string>& knownChildren = {});

/// Per-day averages of the five emotion components for one child, oldest day first.
[[nodiscard]] std::vector<EmotionTrendPoint> BuildEmotionTrends(
    const std::vector<gameplay::SessionResult>& results,
    const std::string& childId);

[[nodiscard]] std::vector<LeaderboardEntry> BuildLeaderboard(const ProfileStore& store);
[[nodiscard]] std::vector<EmotionTrendPoint> BuildEmotionTrends(const ProfileStore& store, const std::string& childId);
} // namespace game::persistence
