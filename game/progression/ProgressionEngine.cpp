#include "game/progression/ProgressionEngine.hpp"

#include <algorithm>
#include <iostream>
#include <limits>

namespace game::progression
{
ProgressionEngine::ProgressionEngine(
    const gameplay::LevelCatalog& catalog,
    AchievementSystem& achievements,
    persistence::ProfileStore& store,
    std::mt19937& rng)
    : m_catalog(catalog)
    , m_achievements(achievements)
    , m_store(store)
    , m_rng(rng)
{
}

const persistence::DailyChallenge& ProgressionEngine::GetDailyChallenge(
    const std::string& childId,
    const engine::core::CalendarDate& today,
    const persistence::PersistCallback& onPersist)
{
    const auto key = std::make_pair(childId, today.ToDays());
    PruneChallengesBefore(childId, key.second);

    const auto existing = m_challenges.find(key);
    if (existing != m_challenges.end())
    {
        return existing->second;
    }
    if (const auto stored = m_store.GetDailyChallenge(childId, today))
    {
        return m_challenges.emplace(key, *stored).first->second;
    }

    std::uniform_int_distribution<std::size_t> variantDist(0, gameplay::kAllVariants.size() - 1);
    const gameplay::Variant variant = gameplay::kAllVariants[variantDist(m_rng)];

    const std::vector<gameplay::Level>& levels = m_catalog.GetLevels(variant);
    std::uniform_int_distribution<std::size_t> levelDist(0, levels.size() - 1);

    persistence::DailyChallenge challenge;
    challenge.childId = childId;
    challenge.variant = variant;
    challenge.levelId = levels[levelDist(m_rng)].id;
    challenge.assignedDate = today;
    challenge.completed = false;

    std::cout << "ProgressionEngine: Daily challenge for " << childId << " on " << today.ToString() << ": "
              << gameplay::VariantToText(variant) << " level " << challenge.levelId << "\n";

    const auto& stored = m_challenges.emplace(key, challenge).first->second;
    m_store.UpsertDailyChallenge(stored, onPersist);
    return stored;
}

void ProgressionEngine::PruneChallengesBefore(const std::string& childId, long long day)
{
    const auto first = m_challenges.lower_bound({childId, std::numeric_limits<long long>::min()});
    const auto last = m_challenges.lower_bound({childId, day});
    m_challenges.erase(first, last);
}

persistence::StreakState ProgressionEngine::AdvanceStreak(
    const persistence::StreakState& streak,
    const engine::core::CalendarDate& today)
{
    persistence::StreakState next = streak;
    if (!streak.lastPlayDate)
    {
        next.streakDays = 1;
    }
    else
    {
        const long long gap = streak.lastPlayDate->DaysUntil(today);
        if (gap == 0)
        {
            next.streakDays = std::max(streak.streakDays, 1);
        }
        else if (gap == 1)
        {
            next.streakDays = streak.streakDays + 1;
        }
        else
        {
            next.streakDays = 1;
        }
    }
    next.lastPlayDate = today;
    return next;
}

ProgressionUpdate ProgressionEngine::RecordSession(
    const gameplay::SessionResult& result,
    const persistence::PersistCallback& onPersist)
{
    ProgressionUpdate update;
    const engine::core::CalendarDate& today = result.playedOn;

    persistence::StreakState& streak = m_streaks[result.childId];
    streak = AdvanceStreak(streak, today);
    update.streakDays = streak.streakDays;
    m_store.UpsertStreak(result.childId, streak, onPersist);

    const auto challenge = m_challenges.find({result.childId, today.ToDays()});
    if (challenge != m_challenges.end() && !challenge->second.completed
        && challenge->second.variant == result.variant && challenge->second.levelId == result.levelId)
    {
        challenge->second.completed = true;
        update.dailyChallengeCompleted = true;
        std::cout << "ProgressionEngine: " << result.childId << " completed the daily challenge\n";
        m_store.UpsertDailyChallenge(challenge->second, onPersist);
    }

    ChildStats& stats = m_stats[result.childId];
    ++stats.sessionsCompleted;
    stats.streakDays = streak.streakDays;
    stats.variantsCompleted.insert(result.variant);

    const std::vector<persistence::AchievementProgress> changed =
        m_achievements.Evaluate(result.childId, stats, result.emotion, today);
    for (const persistence::AchievementProgress& record : changed)
    {
        if (record.unlockedAt && *record.unlockedAt == today && record.progress >= record.maxProgress)
        {
            update.unlockedAchievements.push_back(record.achievementId);
        }
        m_store.UpsertAchievement(record, onPersist);
    }
    return update;
}

void ProgressionEngine::HydrateFromStore(const std::string& childId, const engine::core::CalendarDate& today)
{
    if (const auto streak = m_store.GetStreak(childId))
    {
        m_streaks[childId] = *streak;
    }

    if (const auto challenge = m_store.GetDailyChallenge(childId, today))
    {
        m_challenges[{childId, today.ToDays()}] = *challenge;
    }

    for (const persistence::AchievementProgress& record : m_store.GetAchievements(childId))
    {
        m_achievements.Restore(record);
    }

    ChildStats stats;
    for (const gameplay::SessionResult& result : m_store.GetSessionResults(childId))
    {
        ++stats.sessionsCompleted;
        stats.variantsCompleted.insert(result.variant);
    }
    stats.streakDays = m_streaks[childId].streakDays;
    m_stats[childId] = stats;
}

persistence::StreakState ProgressionEngine::GetStreak(const std::string& childId) const
{
    const auto it = m_streaks.find(childId);
    return it != m_streaks.end() ? it->second : persistence::StreakState{};
}

ChildStats ProgressionEngine::GetStats(const std::string& childId) const
{
    const auto it = m_stats.find(childId);
    return it != m_stats.end() ? it->second : ChildStats{};
}
} // namespace game::progression
