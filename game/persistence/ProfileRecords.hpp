#pragma once

#include <optional>
#include <string>

#include "engine/core/CalendarDate.hpp"
#include "game/gameplay/GameTypes.hpp"

namespace game::persistence
{
/// Streak continuity of one child. Only the progression engine writes it.
struct StreakState
{
    int streakDays = 0;
    std::optional<engine::core::CalendarDate> lastPlayDate;
};

/// At most one per (childId, assignedDate). `completed` only ever goes false -> true.
struct DailyChallenge
{
    std::string childId;
    gameplay::Variant variant = gameplay::Variant::Runner;
    int levelId = 1;
    engine::core::CalendarDate assignedDate;
    bool completed = false;
};

/// Keyed by (childId, achievementId). Progress never decreases and
/// unlockedAt is written once.
struct AchievementProgress
{
    std::string childId;
    std::string achievementId;
    int progress = 0;
    int maxProgress = 1;
    std::optional<engine::core::CalendarDate> unlockedAt;

    [[nodiscard]] bool IsUnlocked() const { return unlockedAt.has_value(); }
};
} // namespace game::persistence
