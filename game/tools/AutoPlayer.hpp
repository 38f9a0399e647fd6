#pragma once

#include <optional>

#include "game/gameplay/variants/GameVariant.hpp"

namespace game::tools
{
/// Headless bot that picks the next input for a running variant by reading its
/// state. Used by the autoplay executable and by end-to-end tests.
class AutoPlayer
{
public:
    /// @return The input to send this frame, or nothing to wait.
    [[nodiscard]] std::optional<gameplay::Direction> ChooseInput(const gameplay::GameVariant& variant) const;
};
} // namespace game::tools
