#pragma once

#include <vector>

#include <glm/vec2.hpp>

#include "game/gameplay/variants/GameVariant.hpp"
#include "game/maps/MazeGenerator.hpp"

namespace game::gameplay
{

struct MazeNavigationState
{
    maps::MazeGraph maze;
    glm::ivec2 player{0, 0};
    std::vector<glm::ivec2> obstacles;
    int score = 0;
    int moves = 0;
    int blockedMoves = 0;
};

/// Walk a freshly generated perfect maze from the entrance to the exit before
/// the countdown runs out. Obstacle cells end the attempt.
class MazeNavigationGame final : public GameVariant
{
public:
    MazeNavigationGame(
        const Level& level,
        engine::core::TimerQueue& timers,
        std::mt19937& rng,
        const glm::ivec2& mazeSize = glm::ivec2{kMazeWidth, kMazeHeight});

    [[nodiscard]] Variant Kind() const override { return Variant::MazeNavigation; }
    [[nodiscard]] int Score() const override { return m_state.score; }

    [[nodiscard]] const MazeNavigationState& GetState() const { return m_state; }

    /// floor(100 * remaining / limit) + kExitBonus
    [[nodiscard]] static int ComputeExitScore(int remainingSeconds, int timeLimitSeconds);

    [[nodiscard]] static maps::MazeSide ToMazeSide(Direction direction);

    static constexpr int kMazeWidth = 20;
    static constexpr int kMazeHeight = 12;
    static constexpr int kExitBonus = 20;

protected:
    void OnStart() override;
    void OnInput(Direction direction) override;

private:
    glm::ivec2 m_mazeSize;
    MazeNavigationState m_state;
};

} // namespace game::gameplay
