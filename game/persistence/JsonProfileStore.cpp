#include "game/persistence/JsonProfileStore.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace game::persistence
{
namespace
{
constexpr int kDocumentVersion = 1;

nlohmann::json DateToJson(const std::optional<engine::core::CalendarDate>& date)
{
    return date ? nlohmann::json(date->ToString()) : nlohmann::json(nullptr);
}

std::optional<engine::core::CalendarDate> DateFromJson(const nlohmann::json& value)
{
    if (!value.is_string())
    {
        return std::nullopt;
    }
    return engine::core::CalendarDate::Parse(value.get<std::string>());
}

nlohmann::json ResultToJson(const gameplay::SessionResult& result)
{
    return nlohmann::json{
        {"child_id", result.childId},
        {"variant", gameplay::VariantToText(result.variant)},
        {"level_id", result.levelId},
        {"score", result.score},
        {"completion_time", result.completionTimeSeconds},
        {"retry_count", result.retryCount},
        {"success_rate", result.successRate},
        {"reaction_times", result.reactionSamplesMs},
        {"emotion",
         {{"joy", result.emotion.joy},
          {"frustration", result.emotion.frustration},
          {"engagement", result.emotion.engagement},
          {"focus", result.emotion.focus},
          {"overall", result.emotion.overall}}},
        {"sentiment", gameplay::SentimentToText(result.sentiment)},
        {"played_on", result.playedOn.ToString()},
    };
}

std::optional<gameplay::SessionResult> ResultFromJson(const nlohmann::json& json)
{
    const auto variant = gameplay::VariantFromText(json.value("variant", ""));
    const auto playedOn = DateFromJson(json.value("played_on", nlohmann::json()));
    if (!variant || !playedOn)
    {
        return std::nullopt;
    }

    gameplay::SessionResult result;
    result.childId = json.value("child_id", "");
    result.variant = *variant;
    result.levelId = json.value("level_id", 1);
    result.score = json.value("score", 0);
    result.completionTimeSeconds = json.value("completion_time", 0.0);
    result.retryCount = json.value("retry_count", 0);
    result.successRate = json.value("success_rate", 0.0);
    result.reactionSamplesMs = json.value("reaction_times", std::vector<double>{});
    if (json.contains("emotion"))
    {
        const auto& e = json["emotion"];
        result.emotion.joy = e.value("joy", 0.0);
        result.emotion.frustration = e.value("frustration", 0.0);
        result.emotion.engagement = e.value("engagement", 0.0);
        result.emotion.focus = e.value("focus", 0.0);
        result.emotion.overall = e.value("overall", 0.0);
    }

    const std::string sentiment = json.value("sentiment", "neutral");
    if (sentiment == "happy")
        result.sentiment = gameplay::Sentiment::Happy;
    else if (sentiment == "sad")
        result.sentiment = gameplay::Sentiment::Sad;
    else if (sentiment == "stressed")
        result.sentiment = gameplay::Sentiment::Stressed;
    else
        result.sentiment = gameplay::Sentiment::Neutral;

    result.playedOn = *playedOn;
    return result;
}
} // namespace

JsonProfileStore::JsonProfileStore(std::string path)
    : m_path(std::move(path))
{
    Load();
}

bool JsonProfileStore::Load()
{
    std::ifstream file(m_path);
    if (!file.is_open())
    {
        std::cout << "JsonProfileStore: No profile document at '" << m_path << "', starting empty\n";
        return false;
    }

    try
    {
        nlohmann::json root;
        file >> root;

        const int version = root.value("version", 0);
        if (version != kDocumentVersion)
        {
            std::cout << "JsonProfileStore: WARNING - Unexpected document version " << version << ", expected "
                      << kDocumentVersion << "\n";
        }

        for (const auto& resultJson : root.value("results", nlohmann::json::array()))
        {
            if (auto result = ResultFromJson(resultJson))
            {
                m_results.push_back(std::move(*result));
            }
        }

        for (const auto& [childId, streakJson] : root.value("streaks", nlohmann::json::object()).items())
        {
            StreakState streak;
            streak.streakDays = streakJson.value("streak_days", 0);
            streak.lastPlayDate = DateFromJson(streakJson.value("last_play_date", nlohmann::json()));
            m_streaks[childId] = streak;
        }

        for (const auto& challengeJson : root.value("daily_challenges", nlohmann::json::array()))
        {
            const auto variant = gameplay::VariantFromText(challengeJson.value("variant", ""));
            const auto date = DateFromJson(challengeJson.value("date", nlohmann::json()));
            if (!variant || !date)
            {
                continue;
            }
            DailyChallenge challenge;
            challenge.childId = challengeJson.value("child_id", "");
            challenge.variant = *variant;
            challenge.levelId = challengeJson.value("level_id", 1);
            challenge.assignedDate = *date;
            challenge.completed = challengeJson.value("completed", false);
            m_challenges[{challenge.childId, date->ToDays()}] = challenge;
        }

        for (const auto& achievementJson : root.value("achievements", nlohmann::json::array()))
        {
            AchievementProgress progress;
            progress.childId = achievementJson.value("child_id", "");
            progress.achievementId = achievementJson.value("achievement_id", "");
            progress.progress = achievementJson.value("progress", 0);
            progress.maxProgress = achievementJson.value("max_progress", 1);
            progress.unlockedAt = DateFromJson(achievementJson.value("unlocked_at", nlohmann::json()));
            m_achievements[{progress.childId, progress.achievementId}] = progress;
        }

        std::cout << "JsonProfileStore: Loaded " << m_results.size() << " results from " << m_path << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "JsonProfileStore: ERROR - Failed to load '" << m_path << "': " << e.what() << "\n";
        return false;
    }
}

nlohmann::json JsonProfileStore::ToJson() const
{
    nlohmann::json root;
    root["version"] = kDocumentVersion;

    root["results"] = nlohmann::json::array();
    for (const auto& result : m_results)
    {
        root["results"].push_back(ResultToJson(result));
    }

    root["streaks"] = nlohmann::json::object();
    for (const auto& [childId, streak] : m_streaks)
    {
        root["streaks"][childId] = {
            {"streak_days", streak.streakDays},
            {"last_play_date", DateToJson(streak.lastPlayDate)},
        };
    }

    root["daily_challenges"] = nlohmann::json::array();
    for (const auto& [key, challenge] : m_challenges)
    {
        root["daily_challenges"].push_back({
            {"child_id", challenge.childId},
            {"variant", gameplay::VariantToText(challenge.variant)},
            {"level_id", challenge.levelId},
            {"date", challenge.assignedDate.ToString()},
            {"completed", challenge.completed},
        });
    }

    root["achievements"] = nlohmann::json::array();
    for (const auto& [key, progress] : m_achievements)
    {
        root["achievements"].push_back({
            {"child_id", progress.childId},
            {"achievement_id", progress.achievementId},
            {"progress", progress.progress},
            {"max_progress", progress.maxProgress},
            {"unlocked_at", DateToJson(progress.unlockedAt)},
        });
    }
    return root;
}

PersistResult JsonProfileStore::Flush() const
{
    // Serialize first so a failure leaves the previous document on disk.
    std::string document;
    try
    {
        document = ToJson().dump(2);
    }
    catch (const nlohmann::json::exception& e)
    {
        std::cout << "JsonProfileStore: ERROR - Could not serialize profile data: " << e.what() << "\n";
        return PersistResult{false, e.what()};
    }

    std::ofstream file(m_path, std::ios::trunc);
    if (!file.is_open())
    {
        std::cout << "JsonProfileStore: ERROR - Could not write '" << m_path << "'\n";
        return PersistResult{false, "could not open " + m_path + " for writing"};
    }

    file << document << "\n";
    if (!file.good())
    {
        std::cout << "JsonProfileStore: ERROR - Write to '" << m_path << "' failed\n";
        return PersistResult{false, "write to " + m_path + " failed"};
    }
    return PersistResult{};
}

void JsonProfileStore::SaveSessionResult(const gameplay::SessionResult& result, PersistCallback onDone)
{
    if (!BeginWrite(onDone))
    {
        return;
    }
    m_results.push_back(result);
    Notify(onDone, Flush());
}

void JsonProfileStore::UpsertStreak(const std::string& childId, const StreakState& streak, PersistCallback onDone)
{
    if (!BeginWrite(onDone))
    {
        return;
    }
    m_streaks[childId] = streak;
    Notify(onDone, Flush());
}

void JsonProfileStore::UpsertDailyChallenge(const DailyChallenge& challenge, PersistCallback onDone)
{
    if (!BeginWrite(onDone))
    {
        return;
    }
    m_challenges[{challenge.childId, challenge.assignedDate.ToDays()}] = challenge;
    Notify(onDone, Flush());
}

void JsonProfileStore::UpsertAchievement(const AchievementProgress& progress, PersistCallback onDone)
{
    if (!BeginWrite(onDone))
    {
        return;
    }
    m_achievements[{progress.childId, progress.achievementId}] = progress;
    Notify(onDone, Flush());
}
} // namespace game::persistence
