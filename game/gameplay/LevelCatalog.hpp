#pragma once

#include <array>
#include <string>
#include <vector>

#include "game/gameplay/GameTypes.hpp"

namespace game::gameplay
{
/// Read-only level table per variant. Anything missing from the loaded
/// asset falls back to the built-in levels, so every variant always has at
/// least one level.
class LevelCatalog
{
public:
    LevelCatalog();

    /// Replaces the levels of every variant listed in the file. Variants that
    /// are absent or empty keep their built-in levels.
    bool LoadFromJson(const std::string& jsonPath);

    [[nodiscard]] const std::vector<Level>& GetLevels(Variant variant) const;

    /// Unknown ids resolve to the variant's first level.
    [[nodiscard]] const Level& GetLevel(Variant variant, int levelId) const;
    [[nodiscard]] bool HasLevel(Variant variant, int levelId) const;

    [[nodiscard]] static std::vector<Level> DefaultLevels(Variant variant);

private:
    [[nodiscard]] static std::size_t Slot(Variant variant) { return static_cast<std::size_t>(variant); }

    std::array<std::vector<Level>, kAllVariants.size()> m_levels;
};
} // namespace game::gameplay
