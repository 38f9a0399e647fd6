#pragma once

#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/CalendarDate.hpp"
#include "game/gameplay/LevelCatalog.hpp"
#include "game/gameplay/SessionResult.hpp"
#include "game/persistence/ProfileStore.hpp"
#include "game/progression/AchievementSystem.hpp"

namespace game::progression
{
/// What one successful session changed.
struct ProgressionUpdate
{
    int streakDays = 0;
    bool dailyChallengeCompleted = false;
    std::vector<std::string> unlockedAchievements;
};

/// Owns the authoritative in-memory progression of every child it has seen
/// and mirrors each change to the profile store as an upsert. Store failures
/// are reported through the callback and never roll back memory.
class ProgressionEngine
{
public:
    ProgressionEngine(
        const gameplay::LevelCatalog& catalog,
        AchievementSystem& achievements,
        persistence::ProfileStore& store,
        std::mt19937& rng);

    /// Lazily assigns today's challenge: uniform variant, then uniform level of it.
    /// Repeated calls on the same day return the same challenge. A challenge the
    /// store already holds for that day is reused. Earlier days of the same
    /// child are dropped from memory.
    const persistence::DailyChallenge& GetDailyChallenge(
        const std::string& childId,
        const engine::core::CalendarDate& today,
        const persistence::PersistCallback& onPersist = {});

    /// Applies a successful session: streak, daily challenge, achievements.
    ProgressionUpdate RecordSession(
        const gameplay::SessionResult& result,
        const persistence::PersistCallback& onPersist = {});

    /// Pulls previously stored progression for a child into memory.
    void HydrateFromStore(const std::string& childId, const engine::core::CalendarDate& today);

    [[nodiscard]] persistence::StreakState GetStreak(const std::string& childId) const;
    [[nodiscard]] ChildStats GetStats(const std::string& childId) const;
    [[nodiscard]] std::size_t CachedChallengeCount() const { return m_challenges.size(); }

    /// Streak transition by calendar day: first play or a gap resets to 1,
    /// a second play the same day keeps it, a play on the next day adds 1.
    [[nodiscard]] static persistence::StreakState AdvanceStreak(
        const persistence::StreakState& streak,
        const engine::core::CalendarDate& today);

private:
    void PruneChallengesBefore(const std::string& childId, long long day);

    const gameplay::LevelCatalog& m_catalog;
    AchievementSystem& m_achievements;
    persistence::ProfileStore& m_store;
    std::mt19937& m_rng;

    std::map<std::string, persistence::StreakState> m_streaks;
    std::map<std::string, ChildStats> m_stats;
    std::map<std::pair<std::string, long long>, persistence::DailyChallenge> m_challenges;
};
} // namespace game::progression
