#include "game/persistence/InMemoryProfileStore.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>

namespace game::persistence
{
bool InMemoryProfileStore::BeginWrite(const PersistCallback& onDone)
{
    ++m_writeCount;
    if (m_available)
    {
        return true;
    }

    ++m_failedWriteCount;
    std::cout << "ProfileStore: WARNING - Store unavailable, write rejected\n";
    Notify(onDone, PersistResult{false, "profile store unavailable"});
    return false;
}

void InMemoryProfileStore::SaveSessionResult(const gameplay::SessionResult& result, PersistCallback onDone)
{
    if (!BeginWrite(onDone))
    {
        return;
    }
    m_results.push_back(result);
    Notify(onDone, PersistResult{});
}

void InMemoryProfileStore::UpsertStreak(const std::string& childId, const StreakState& streak, PersistCallback onDone)
{
    if (!BeginWrite(onDone))
    {
        return;
    }
    m_streaks[childId] = streak;
    Notify(onDone, PersistResult{});
}

void InMemoryProfileStore::UpsertDailyChallenge(const DailyChallenge& challenge, PersistCallback onDone)
{
    if (!BeginWrite(onDone))
    {
        return;
    }
    m_challenges[{challenge.childId, challenge.assignedDate.ToDays()}] = challenge;
    Notify(onDone, PersistResult{});
}

void InMemoryProfileStore::UpsertAchievement(const AchievementProgress& progress, PersistCallback onDone)
{
    if (!BeginWrite(onDone))
    {
        return;
    }
    m_achievements[{progress.childId, progress.achievementId}] = progress;
    Notify(onDone, PersistResult{});
}

std::vector<gameplay::SessionResult> InMemoryProfileStore::GetSessionResults(const std::string& childId) const
{
    std::vector<gameplay::SessionResult> results;
    std::copy_if(m_results.begin(), m_results.end(), std::back_inserter(results), [&childId](const auto& result) {
        return result.childId == childId;
    });
    return results;
}

std::vector<gameplay::SessionResult> InMemoryProfileStore::GetAllSessionResults() const
{
    return m_results;
}

std::optional<StreakState> InMemoryProfileStore::GetStreak(const std::string& childId) const
{
    const auto it = m_streaks.find(childId);
    if (it == m_streaks.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<DailyChallenge> InMemoryProfileStore::GetDailyChallenge(
    const std::string& childId,
    const engine::core::CalendarDate& date) const
{
    const auto it = m_challenges.find({childId, date.ToDays()});
    if (it == m_challenges.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AchievementProgress> InMemoryProfileStore::GetAchievements(const std::string& childId) const
{
    std::vector<AchievementProgress> progress;
    for (const auto& [key, value] : m_achievements)
    {
        if (key.first == childId)
        {
            progress.push_back(value);
        }
    }
    return progress;
}
} // namespace game::persistence
