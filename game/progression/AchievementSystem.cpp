#include "game/progression/AchievementSystem.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace game::progression
{
const char* AchievementKindToText(AchievementKind kind)
{
    switch (kind)
    {
        case AchievementKind::FirstPlay: return "first_play";
        case AchievementKind::GamesPlayed: return "games_played";
        case AchievementKind::FocusThreshold: return "focus_threshold";
        case AchievementKind::StreakDays: return "streak_days";
        case AchievementKind::JoyThreshold: return "joy_threshold";
        case AchievementKind::DistinctVariants: return "distinct_variants";
        default: return "unknown";
    }
}

std::optional<AchievementKind> AchievementKindFromText(const std::string& text)
{
    for (AchievementKind kind : {AchievementKind::FirstPlay,
                                 AchievementKind::GamesPlayed,
                                 AchievementKind::FocusThreshold,
                                 AchievementKind::StreakDays,
                                 AchievementKind::JoyThreshold,
                                 AchievementKind::DistinctVariants})
    {
        if (text == AchievementKindToText(kind))
        {
            return kind;
        }
    }
    return std::nullopt;
}

AchievementSystem::AchievementSystem()
    : m_rules(DefaultRules())
{
}

std::vector<AchievementRule> AchievementSystem::DefaultRules()
{
    return {
        {"first_play", "First Steps", "Finish your first game", AchievementKind::FirstPlay, 1, 0.0},
        {"ten_games", "Getting Started", "Finish ten games", AchievementKind::GamesPlayed, 10, 0.0},
        {"laser_focus", "Laser Focus", "Reach a focus score of 0.8", AchievementKind::FocusThreshold, 1, 0.8},
        {"week_streak", "Week Warrior", "Play seven days in a row", AchievementKind::StreakDays, 7, 0.0},
        {"happy_player", "Happy Player", "Reach a joy score of 0.8", AchievementKind::JoyThreshold, 1, 0.8},
        {"explorer", "Explorer", "Finish every kind of game", AchievementKind::DistinctVariants, 4, 0.0},
    };
}

bool AchievementSystem::LoadFromJson(const std::string& jsonPath)
{
    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cout << "AchievementSystem: WARNING - Could not open achievements.json at '" << jsonPath
                  << "', using built-in rules\n";
        return false;
    }

    try
    {
        nlohmann::json root;
        file >> root;

        const int assetVersion = root.value("asset_version", 0);
        if (assetVersion != 1)
        {
            std::cout << "AchievementSystem: WARNING - Unexpected asset version " << assetVersion << ", expected 1\n";
        }

        if (!root.contains("achievements"))
        {
            std::cout << "AchievementSystem: WARNING - No 'achievements' array found in JSON\n";
            return false;
        }

        std::vector<AchievementRule> rules;
        for (const auto& ruleJson : root["achievements"])
        {
            AchievementRule rule;
            rule.id = ruleJson.value("id", "");
            rule.name = ruleJson.value("name", rule.id);
            rule.description = ruleJson.value("description", "");
            rule.maxProgress = std::max(ruleJson.value("max_progress", 1), 1);
            rule.threshold = ruleJson.value("threshold", 0.0);

            const auto kind = AchievementKindFromText(ruleJson.value("kind", ""));
            if (rule.id.empty() || !kind)
            {
                std::cout << "AchievementSystem: WARNING - Skipping achievement '" << rule.id
                          << "' with missing id or unknown kind\n";
                continue;
            }
            rule.kind = *kind;
            rules.push_back(std::move(rule));
        }

        if (rules.empty())
        {
            std::cout << "AchievementSystem: WARNING - No usable achievements, keeping built-in rules\n";
            return false;
        }

        m_rules = std::move(rules);
        std::cout << "AchievementSystem: Loaded " << m_rules.size() << " achievements from " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "AchievementSystem: ERROR - Failed to load achievements.json: " << e.what() << "\n";
        return false;
    }
}

const AchievementRule* AchievementSystem::FindRule(const std::string& achievementId) const
{
    const auto it = std::find_if(m_rules.begin(), m_rules.end(), [&achievementId](const AchievementRule& rule) {
        return rule.id == achievementId;
    });
    return it != m_rules.end() ? &(*it) : nullptr;
}

int AchievementSystem::ComputeProgress(
    const AchievementRule& rule,
    const ChildStats& stats,
    const gameplay::EmotionScore& emotion)
{
    int progress = 0;
    switch (rule.kind)
    {
        case AchievementKind::FirstPlay:
        case AchievementKind::GamesPlayed:
            progress = stats.sessionsCompleted;
            break;
        case AchievementKind::FocusThreshold:
            progress = emotion.focus >= rule.threshold ? rule.maxProgress : 0;
            break;
        case AchievementKind::StreakDays:
            progress = stats.streakDays;
            break;
        case AchievementKind::JoyThreshold:
            progress = emotion.joy >= rule.threshold ? rule.maxProgress : 0;
            break;
        case AchievementKind::DistinctVariants:
            progress = static_cast<int>(stats.variantsCompleted.size());
            break;
    }
    return std::clamp(progress, 0, rule.maxProgress);
}

std::vector<persistence::AchievementProgress> AchievementSystem::Evaluate(
    const std::string& childId,
    const ChildStats& stats,
    const gameplay::EmotionScore& emotion,
    const engine::core::CalendarDate& today)
{
    std::vector<persistence::AchievementProgress> changed;
    for (const AchievementRule& rule : m_rules)
    {
        auto [it, inserted] = m_progress.try_emplace({childId, rule.id});
        persistence::AchievementProgress& record = it->second;
        if (inserted)
        {
            record.childId = childId;
            record.achievementId = rule.id;
            record.maxProgress = rule.maxProgress;
        }

        const int computed = ComputeProgress(rule, stats, emotion);
        bool dirty = inserted;
        if (computed > record.progress)
        {
            record.progress = computed;
            dirty = true;
        }

        if (!record.unlockedAt && record.progress >= record.maxProgress)
        {
            record.unlockedAt = today;
            dirty = true;
            std::cout << "AchievementSystem: " << childId << " unlocked '" << rule.name << "'\n";
        }

        if (dirty)
        {
            changed.push_back(record);
        }
    }
    return changed;
}

void AchievementSystem::Restore(const persistence::AchievementProgress& record)
{
    auto [it, inserted] = m_progress.try_emplace({record.childId, record.achievementId}, record);
    if (inserted)
    {
        return;
    }

    persistence::AchievementProgress& existing = it->second;
    existing.progress = std::max(existing.progress, record.progress);
    if (!existing.unlockedAt)
    {
        existing.unlockedAt = record.unlockedAt;
    }
}

std::optional<persistence::AchievementProgress> AchievementSystem::GetProgress(
    const std::string& childId,
    const std::string& achievementId) const
{
    const auto it = m_progress.find({childId, achievementId});
    if (it == m_progress.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<persistence::AchievementProgress> AchievementSystem::GetAllProgress(const std::string& childId) const
{
    std::vector<persistence::AchievementProgress> records;
    for (const auto& [key, record] : m_progress)
    {
        if (key.first == childId)
        {
            records.push_back(record);
        }
    }
    return records;
}

int AchievementSystem::CountUnlocked(const std::string& childId) const
{
    int unlocked = 0;
    for (const auto& [key, record] : m_progress)
    {
        if (key.first == childId && record.IsUnlocked())
        {
            ++unlocked;
        }
    }
    return unlocked;
}
} // namespace game::progression
