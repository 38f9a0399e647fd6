#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "game/persistence/InMemoryProfileStore.hpp"

namespace game::persistence
{
/// Profile store backed by one JSON document on disk. The document is
/// reloaded on construction and rewritten after every accepted write.
class JsonProfileStore : public InMemoryProfileStore
{
public:
    explicit JsonProfileStore(std::string path);

    void SaveSessionResult(const gameplay::SessionResult& result, PersistCallback onDone) override;
    void UpsertStreak(const std::string& childId, const StreakState& streak, PersistCallback onDone) override;
    void UpsertDailyChallenge(const DailyChallenge& challenge, PersistCallback onDone) override;
    void UpsertAchievement(const AchievementProgress& progress, PersistCallback onDone) override;

    [[nodiscard]] const std::string& Path() const { return m_path; }

private:
    bool Load();
    [[nodiscard]] PersistResult Flush() const;
    [[nodiscard]] nlohmann::json ToJson() const;

    std::string m_path;
};
} // namespace game::persistence
