#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "game/gameplay/SessionResult.hpp"
#include "game/persistence/ProfileRecords.hpp"

namespace game::persistence
{
struct PersistResult
{
    bool ok = true;
    std::string error;
};

using PersistCallback = std::function<void(const PersistResult&)>;

/// External persistence collaborator. Writes are fire-and-forget for the
/// caller: the outcome arrives through the callback and a failure never
/// touches the caller's in-memory state. Upserts are idempotent per key.
class ProfileStore
{
public:
    virtual ~ProfileStore() = default;

    virtual void SaveSessionResult(const gameplay::SessionResult& result, PersistCallback onDone) = 0;
    virtual void UpsertStreak(const std::string& childId, const StreakState& streak, PersistCallback onDone) = 0;
    virtual void UpsertDailyChallenge(const DailyChallenge& challenge, PersistCallback onDone) = 0;
    virtual void UpsertAchievement(const AchievementProgress& progress, PersistCallback onDone) = 0;

    [[nodiscard]] virtual std::vector<gameplay::SessionResult> GetSessionResults(const std::string& childId) const = 0;
    [[nodiscard]] virtual std::vector<gameplay::SessionResult> GetAllSessionResults() const = 0;
    [[nodiscard]] virtual std::optional<StreakState> GetStreak(const std::string& childId) const = 0;
    [[nodiscard]] virtual std::optional<DailyChallenge> GetDailyChallenge(
        const std::string& childId,
        const engine::core::CalendarDate& date) const = 0;
    [[nodiscard]] virtual std::vector<AchievementProgress> GetAchievements(const std::string& childId) const = 0;
};

/// Runs the optional callback; stores call this exactly once per write.
inline void Notify(const PersistCallback& onDone, PersistResult result)
{
    if (onDone)
    {
        onDone(result);
    }
}
} // namespace game::persistence
