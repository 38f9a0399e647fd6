#include "game/gameplay/LevelCatalog.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace game::gameplay
{
namespace
{
Level MakeLevel(int id, const char* name, Difficulty difficulty, float speed, int obstacles, int timeLimit)
{
    Level level;
    level.id = id;
    level.displayName = name;
    level.difficulty = difficulty;
    level.speed = speed;
    level.obstacleCount = obstacles;
    level.timeLimitSeconds = timeLimit;
    return level;
}
} // namespace

LevelCatalog::LevelCatalog()
{
    for (Variant variant : kAllVariants)
    {
        m_levels[Slot(variant)] = DefaultLevels(variant);
    }
}

std::vector<Level> LevelCatalog::DefaultLevels(Variant variant)
{
    switch (variant)
    {
        case Variant::Runner:
            return {
                MakeLevel(1, "Forest Path", Difficulty::Easy, 1.0F, 5, 60),
                MakeLevel(2, "Castle Bridge", Difficulty::Medium, 1.5F, 8, 50),
                MakeLevel(3, "Dragon Keep", Difficulty::Hard, 2.0F, 12, 45),
            };
        case Variant::GridGrowth:
            return {
                MakeLevel(1, "Garden Maze", Difficulty::Easy, 1.0F, 0, 60),
                MakeLevel(2, "Forest Clearing", Difficulty::Medium, 1.5F, 3, 50),
                MakeLevel(3, "Ancient Ruins", Difficulty::Hard, 2.0F, 5, 45),
            };
        case Variant::PatternRecall:
            return {
                MakeLevel(1, "Village Square", Difficulty::Easy, 1.0F, 0, 45),
                MakeLevel(2, "Crystal Cave", Difficulty::Medium, 1.5F, 0, 40),
                MakeLevel(3, "Mystic Temple", Difficulty::Hard, 2.0F, 0, 30),
            };
        case Variant::MazeNavigation:
            return {
                MakeLevel(1, "Hedge Maze", Difficulty::Easy, 1.0F, 0, 60),
                MakeLevel(2, "Desert Labyrinth", Difficulty::Medium, 1.0F, 0, 75),
                MakeLevel(3, "Ice Cavern", Difficulty::Hard, 1.0F, 3, 90),
            };
        default:
            return {MakeLevel(1, "Default", Difficulty::Easy, 1.0F, 0, 60)};
    }
}

bool LevelCatalog::LoadFromJson(const std::string& jsonPath)
{
    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cout << "LevelCatalog: WARNING - Could not open levels.json at '" << jsonPath << "', using built-in levels\n";
        return false;
    }

    try
    {
        nlohmann::json root;
        file >> root;

        const int assetVersion = root.value("asset_version", 0);
        if (assetVersion != 1)
        {
            std::cout << "LevelCatalog: WARNING - Unexpected asset version " << assetVersion << ", expected 1\n";
        }

        if (!root.contains("variants") || !root["variants"].is_object())
        {
            std::cout << "LevelCatalog: WARNING - No 'variants' object found in JSON\n";
            return false;
        }

        int loaded = 0;
        for (const auto& [variantKey, levelsJson] : root["variants"].items())
        {
            const auto variant = VariantFromText(variantKey);
            if (!variant)
            {
                std::cout << "LevelCatalog: WARNING - Unknown variant '" << variantKey << "' skipped\n";
                continue;
            }

            std::vector<Level> levels;
            for (const auto& levelJson : levelsJson)
            {
                Level level;
                level.id = levelJson.value("id", static_cast<int>(levels.size()) + 1);
                level.displayName = levelJson.value("name", "");

                const std::string difficultyStr = levelJson.value("difficulty", "easy");
                level.difficulty = DifficultyFromText(difficultyStr).value_or(Difficulty::Easy);

                level.speed = levelJson.value("speed", 1.0F);
                level.obstacleCount = levelJson.value("obstacles", 0);
                level.timeLimitSeconds = levelJson.value("time_limit", 60);

                if (level.speed <= 0.0F || level.timeLimitSeconds <= 0 || level.obstacleCount < 0)
                {
                    std::cout << "LevelCatalog: WARNING - Level " << level.id << " of '" << variantKey
                              << "' has invalid parameters, skipped\n";
                    continue;
                }
                levels.push_back(std::move(level));
            }

            if (levels.empty())
            {
                std::cout << "LevelCatalog: WARNING - No usable levels for '" << variantKey << "', keeping built-in levels\n";
                continue;
            }

            loaded += static_cast<int>(levels.size());
            m_levels[Slot(*variant)] = std::move(levels);
        }

        std::cout << "LevelCatalog: Loaded " << loaded << " levels from " << jsonPath << "\n";
        return loaded > 0;
    }
    catch (const std::exception& e)
    {
        std::cout << "LevelCatalog: ERROR - Failed to load levels.json: " << e.what() << "\n";
        return false;
    }
}

const std::vector<Level>& LevelCatalog::GetLevels(Variant variant) const
{
    return m_levels[Slot(variant)];
}

const Level& LevelCatalog::GetLevel(Variant variant, int levelId) const
{
    const std::vector<Level>& levels = m_levels[Slot(variant)];
    const auto it = std::find_if(levels.begin(), levels.end(), [levelId](const Level& level) {
        return level.id == levelId;
    });
    if (it != levels.end())
    {
        return *it;
    }

    std::cout << "LevelCatalog: WARNING - Level " << levelId << " not found for '" << VariantToText(variant)
              << "', using level " << levels.front().id << "\n";
    return levels.front();
}

bool LevelCatalog::HasLevel(Variant variant, int levelId) const
{
    const std::vector<Level>& levels = m_levels[Slot(variant)];
    return std::any_of(levels.begin(), levels.end(), [levelId](const Level& level) { return level.id == levelId; });
}
} // namespace game::gameplay
