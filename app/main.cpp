#include <cstdint>
#include <iostream>
#include <random>
#include <string>

#include "engine/core/CalendarDate.hpp"
#include "game/gameplay/EmotionScoring.hpp"
#include "game/gameplay/LevelCatalog.hpp"
#include "game/gameplay/SessionController.hpp"
#include "game/persistence/Analytics.hpp"
#include "game/persistence/JsonProfileStore.hpp"
#include "game/progression/AchievementSystem.hpp"
#include "game/progression/ProgressionEngine.hpp"
#include "game/tools/AutoPlayer.hpp"

#ifndef MINDBLOOM_CONFIG_DIR
#define MINDBLOOM_CONFIG_DIR "config"
#endif

namespace
{
struct Options
{
    std::string childId = "demo-child";
    std::string variant = "maze-navigation";
    int levelId = 1;
    std::string date = "2024-01-01";
    std::string configDir = MINDBLOOM_CONFIG_DIR;
    std::string storePath = "mindbloom_profiles.json";
    std::uint32_t seed = 1337;
    int maxAttempts = 3;
    double inputIntervalSeconds = 0.25;
};

void PrintUsage()
{
    std::cout << "Usage: mindbloom_autoplay [--child ID] [--variant runner|pattern-recall|grid-growth|maze-navigation]\n"
                 "                          [--level N] [--date YYYY-MM-DD] [--config DIR] [--store FILE]\n"
                 "                          [--seed N] [--attempts N]\n";
}

bool ParseOptions(int argc, char** argv, Options& options)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        try
        {
            if (arg == "--help" || arg == "-h")
            {
                return false;
            }
            if (!hasValue)
            {
                std::cout << "Missing value for " << arg << "\n";
                return false;
            }

            const std::string value = argv[++i];
            if (arg == "--child")
                options.childId = value;
            else if (arg == "--variant")
                options.variant = value;
            else if (arg == "--level")
                options.levelId = std::stoi(value);
            else if (arg == "--date")
                options.date = value;
            else if (arg == "--config")
                options.configDir = value;
            else if (arg == "--store")
                options.storePath = value;
            else if (arg == "--seed")
                options.seed = static_cast<std::uint32_t>(std::stoul(value));
            else if (arg == "--attempts")
                options.maxAttempts = std::stoi(value);
            else
            {
                std::cout << "Unknown option " << arg << "\n";
                return false;
            }
        }
        catch (const std::exception& e)
        {
            std::cout << "Invalid value for " << arg << ": " << e.what() << "\n";
            return false;
        }
    }
    return true;
}

/// Plays attempts at a simulated 60 Hz until one succeeds or the attempt budget runs out.
bool PlaySession(game::gameplay::SessionController& session, const Options& options)
{
    const game::tools::AutoPlayer bot;
    constexpr double kFrameSeconds = 1.0 / 60.0;
    double now = 0.0;

    for (int attempt = 0; attempt < options.maxAttempts; ++attempt)
    {
        if (!session.StartAttempt(now))
        {
            return false;
        }

        double nextInputAt = now;
        while (session.State() == game::gameplay::SessionState::Active)
        {
            now += kFrameSeconds;
            if (now >= nextInputAt && session.CurrentVariant() != nullptr)
            {
                if (const auto input = bot.ChooseInput(*session.CurrentVariant()))
                {
                    if (session.QueueInput(*input, now * 1000.0))
                    {
                        nextInputAt = now + options.inputIntervalSeconds;
                    }
                }
            }
            session.Update(now);
        }

        if (session.State() == game::gameplay::SessionState::Completed)
        {
            return true;
        }
        if (!session.Retry())
        {
            return false;
        }
    }
    return false;
}
} // namespace

int main(int argc, char** argv)
{
    Options options;
    if (!ParseOptions(argc, argv, options))
    {
        PrintUsage();
        return 1;
    }

    const auto variant = game::gameplay::VariantFromText(options.variant);
    const auto today = engine::core::CalendarDate::Parse(options.date);
    if (!variant || !today)
    {
        std::cout << "Unknown variant '" << options.variant << "' or bad date '" << options.date << "'\n";
        PrintUsage();
        return 1;
    }

    game::gameplay::LevelCatalog catalog;
    if (!catalog.LoadFromJson(options.configDir + "/levels.json"))
    {
        std::cout << "Continuing with built-in levels\n";
    }

    game::progression::AchievementSystem achievements;
    if (!achievements.LoadFromJson(options.configDir + "/achievements.json"))
    {
        std::cout << "Continuing with built-in achievements\n";
    }

    game::gameplay::EmotionWeights weights;
    if (!weights.LoadFromJson(options.configDir + "/emotion_weights.json"))
    {
        std::cout << "Continuing with default scoring weights\n";
    }

    std::mt19937 rng(options.seed);
    game::persistence::JsonProfileStore store(options.storePath);
    game::progression::ProgressionEngine progression(catalog, achievements, store, rng);
    progression.HydrateFromStore(options.childId, *today);

    const auto& challenge = progression.GetDailyChallenge(options.childId, *today);
    std::cout << "Daily challenge: " << game::gameplay::VariantDisplayName(challenge.variant) << " level "
              << challenge.levelId << (challenge.completed ? " (done)" : "") << "\n";

    game::gameplay::SessionController session(catalog, progression, store, rng, weights);
    if (!session.Open(options.childId, *variant, options.levelId, *today) || !session.AcknowledgeInstructions())
    {
        return 1;
    }

    if (!PlaySession(session, options))
    {
        std::cout << "No successful attempt after " << session.RetryCount() + 1 << " tries\n";
        session.Abandon();
        return 2;
    }

    const auto summary = session.GetSummary();
    if (!summary)
    {
        return 1;
    }

    const auto& result = summary->result;
    std::cout << "Score " << result.score << " in " << result.completionTimeSeconds << " s, retries "
              << result.retryCount << ", sentiment " << game::gameplay::SentimentToText(result.sentiment) << "\n";
    std::cout << "Emotion joy " << result.emotion.joy << " frustration " << result.emotion.frustration
              << " engagement " << result.emotion.engagement << " focus " << result.emotion.focus << " overall "
              << result.emotion.overall << "\n";
    std::cout << "Streak " << summary->progression.streakDays << " day(s)"
              << (summary->progression.dailyChallengeCompleted ? ", daily challenge completed" : "") << "\n";
    for (const std::string& unlocked : summary->progression.unlockedAchievements)
    {
        std::cout << "Unlocked achievement: " << unlocked << "\n";
    }

    if (const auto& error = session.LastPersistError())
    {
        std::cout << "Warning: progress not saved (" << *error << ")\n";
    }

    for (const auto& entry : game::persistence::BuildLeaderboard(store))
    {
        std::cout << "#" << entry.rank << " " << entry.childId << " " << entry.totalScore << "\n";
    }
    return 0;
}
