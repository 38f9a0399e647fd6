#include "game/persistence/Analytics.hpp"

#include <algorithm>
#include <map>

namespace game::persistence
{
std::vector<LeaderboardEntry> BuildLeaderboard(
    const std::vector<gameplay::SessionResult>& results,
    const std::vector<std::string>& knownChildren)
{
    std::map<std::string, LeaderboardEntry> totals;
    for (const std::string& childId : knownChildren)
    {
        totals[childId].childId = childId;
    }
    for (const auto& result : results)
    {
        LeaderboardEntry& entry = totals[result.childId];
        entry.childId = result.childId;
        entry.totalScore += result.score;
        ++entry.sessions;
    }

    std::vector<LeaderboardEntry> entries;
    entries.reserve(totals.size());
    for (auto& [childId, entry] : totals)
    {
        entries.push_back(entry);
    }

    std::stable_sort(entries.begin(), entries.end(), [](const LeaderboardEntry& a, const LeaderboardEntry& b) {
        return a.totalScore > b.totalScore;
    });

    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        entries[i].rank = static_cast<int>(i) + 1;
    }
    return entries;
}

std::vector<EmotionTrendPoint> BuildEmotionTrends(
    const std::vector<gameplay::SessionResult>& results,
    const std::string& childId)
{
    std::map<long long, EmotionTrendPoint> byDay;
    for (const auto& result : results)
    {
        if (result.childId != childId)
        {
            continue;
        }
        EmotionTrendPoint& point = byDay[result.playedOn.ToDays()];
        point.date = result.playedOn;
        point.average.joy += result.emotion.joy;
        point.average.frustration += result.emotion.frustration;
        point.average.engagement += result.emotion.engagement;
        point.average.focus += result.emotion.focus;
        point.average.overall += result.emotion.overall;
        ++point.sessions;
    }

    std::vector<EmotionTrendPoint> trends;
    trends.reserve(byDay.size());
    for (auto& [day, point] : byDay)
    {
        const double count = static_cast<double>(point.sessions);
        point.average.joy /= count;
        point.average.frustration /= count;
        point.average.engagement /= count;
        point.average.focus /= count;
        point.average.overall /= count;
        trends.push_back(point);
    }
    return trends;
}

std::vector<LeaderboardEntry> BuildLeaderboard(const ProfileStore& store)
{
    return BuildLeaderboard(store.GetAllSessionResults());
}

std::vector<EmotionTrendPoint> BuildEmotionTrends(const ProfileStore& store, const std::string& childId)
{
    return BuildEmotionTrends(store.GetSessionResults(childId), childId);
}
} // namespace game::persistence
