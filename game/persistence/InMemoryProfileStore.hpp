#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "game/persistence/ProfileStore.hpp"

namespace game::persistence
{
/// Development store kept entirely in memory. Can be switched unavailable
/// to exercise the caller's failure handling.
class InMemoryProfileStore : public ProfileStore
{
public:
    void SaveSessionResult(const gameplay::SessionResult& result, PersistCallback onDone) override;
    void UpsertStreak(const std::string& childId, const StreakState& streak, PersistCallback onDone) override;
    void UpsertDailyChallenge(const DailyChallenge& challenge, PersistCallback onDone) override;
    void UpsertAchievement(const AchievementProgress& progress, PersistCallback onDone) override;

    [[nodiscard]] std::vector<gameplay::SessionResult> GetSessionResults(const std::string& childId) const override;
    [[nodiscard]] std::vector<gameplay::SessionResult> GetAllSessionResults() const override;
    [[nodiscard]] std::optional<StreakState> GetStreak(const std::string& childId) const override;
    [[nodiscard]] std::optional<DailyChallenge> GetDailyChallenge(
        const std::string& childId,
        const engine::core::CalendarDate& date) const override;
    [[nodiscard]] std::vector<AchievementProgress> GetAchievements(const std::string& childId) const override;

    void SetAvailable(bool available) { m_available = available; }
    [[nodiscard]] bool IsAvailable() const { return m_available; }
    [[nodiscard]] int WriteCount() const { return m_writeCount; }
    [[nodiscard]] int FailedWriteCount() const { return m_failedWriteCount; }

protected:
    /// Checks availability, counts the write and reports the failure when the store is down.
    bool BeginWrite(const PersistCallback& onDone);

    std::vector<gameplay::SessionResult> m_results;
    std::map<std::string, StreakState> m_streaks;
    std::map<std::pair<std::string, long long>, DailyChallenge> m_challenges;
    std::map<std::pair<std::string, std::string>, AchievementProgress> m_achievements;

private:
    bool m_available = true;
    int m_writeCount = 0;
    int m_failedWriteCount = 0;
};
} // namespace game::persistence
