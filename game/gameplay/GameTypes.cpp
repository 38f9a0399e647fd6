#include "game/gameplay/GameTypes.hpp"

#include <algorithm>
#include <cctype>

namespace game::gameplay
{
namespace
{
[[nodiscard]] std::string ToLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}
} // namespace

Direction Opposite(Direction direction)
{
    switch (direction)
    {
        case Direction::Up: return Direction::Down;
        case Direction::Down: return Direction::Up;
        case Direction::Left: return Direction::Right;
        case Direction::Right: return Direction::Left;
    }
    return direction;
}

glm::ivec2 DirectionOffset(Direction direction)
{
    switch (direction)
    {
        case Direction::Up: return glm::ivec2{0, -1};
        case Direction::Down: return glm::ivec2{0, 1};
        case Direction::Left: return glm::ivec2{-1, 0};
        case Direction::Right: return glm::ivec2{1, 0};
    }
    return glm::ivec2{0, 0};
}

const char* DirectionToText(Direction direction)
{
    switch (direction)
    {
        case Direction::Up: return "up";
        case Direction::Down: return "down";
        case Direction::Left: return "left";
        case Direction::Right: return "right";
        default: return "unknown";
    }
}

const char* DifficultyToText(Difficulty difficulty)
{
    switch (difficulty)
    {
        case Difficulty::Easy: return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard: return "hard";
        default: return "unknown";
    }
}

const char* VariantToText(Variant variant)
{
    switch (variant)
    {
        case Variant::Runner: return "runner";
        case Variant::PatternRecall: return "pattern-recall";
        case Variant::GridGrowth: return "grid-growth";
        case Variant::MazeNavigation: return "maze-navigation";
        default: return "unknown";
    }
}

const char* VariantDisplayName(Variant variant)
{
    switch (variant)
    {
        case Variant::Runner: return "Mage Run";
        case Variant::PatternRecall: return "Mirror Moves";
        case Variant::GridGrowth: return "Snake Game";
        case Variant::MazeNavigation: return "Maze Runner";
        default: return "Game";
    }
}

std::optional<Direction> DirectionFromText(const std::string& text)
{
    const std::string lower = ToLower(text);
    for (Direction direction : kAllDirections)
    {
        if (lower == DirectionToText(direction))
        {
            return direction;
        }
    }
    return std::nullopt;
}

std::optional<Difficulty> DifficultyFromText(const std::string& text)
{
    const std::string lower = ToLower(text);
    if (lower == "easy")
        return Difficulty::Easy;
    if (lower == "medium")
        return Difficulty::Medium;
    if (lower == "hard")
        return Difficulty::Hard;
    return std::nullopt;
}

std::optional<Variant> VariantFromText(const std::string& text)
{
    const std::string lower = ToLower(text);
    for (Variant variant : kAllVariants)
    {
        if (lower == VariantToText(variant))
        {
            return variant;
        }
    }
    return std::nullopt;
}
} // namespace game::gameplay
