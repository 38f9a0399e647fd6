#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include <glm/vec2.hpp>

namespace game::gameplay
{
enum class Direction : std::uint8_t
{
    Up,
    Down,
    Left,
    Right
};

enum class Difficulty : std::uint8_t
{
    Easy,
    Medium,
    Hard
};

/// The four fixed mini-game rule sets.
enum class Variant : std::uint8_t
{
    Runner,
    PatternRecall,
    GridGrowth,
    MazeNavigation
};

constexpr std::array<Variant, 4> kAllVariants = {
    Variant::Runner,
    Variant::PatternRecall,
    Variant::GridGrowth,
    Variant::MazeNavigation,
};

constexpr std::array<Direction, 4> kAllDirections = {
    Direction::Up,
    Direction::Down,
    Direction::Left,
    Direction::Right,
};

/// Immutable per-session level parameters.
struct Level
{
    int id = 1;
    std::string displayName;
    Difficulty difficulty = Difficulty::Easy;
    float speed = 1.0F;
    int obstacleCount = 0;
    int timeLimitSeconds = 60;
};

// Logical playfield shared by the canvas-style variants.
constexpr float kFieldWidth = 800.0F;
constexpr float kFieldHeight = 500.0F;

[[nodiscard]] Direction Opposite(Direction direction);

/// Screen-space unit step: Up decreases y.
[[nodiscard]] glm::ivec2 DirectionOffset(Direction direction);

[[nodiscard]] const char* DirectionToText(Direction direction);
[[nodiscard]] const char* DifficultyToText(Difficulty difficulty);
[[nodiscard]] const char* VariantToText(Variant variant);
[[nodiscard]] const char* VariantDisplayName(Variant variant);

[[nodiscard]] std::optional<Direction> DirectionFromText(const std::string& text);
[[nodiscard]] std::optional<Difficulty> DifficultyFromText(const std::string& text);
[[nodiscard]] std::optional<Variant> VariantFromText(const std::string& text);
} // namespace game::gameplay
