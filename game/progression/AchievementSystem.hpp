#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/CalendarDate.hpp"
#include "game/gameplay/EmotionScoring.hpp"
#include "game/gameplay/GameTypes.hpp"
#include "game/persistence/ProfileRecords.hpp"

namespace game::progression
{
enum class AchievementKind : std::uint8_t
{
    FirstPlay,
    GamesPlayed,
    FocusThreshold,
    StreakDays,
    JoyThreshold,
    DistinctVariants
};

[[nodiscard]] const char* AchievementKindToText(AchievementKind kind);
[[nodiscard]] std::optional<AchievementKind> AchievementKindFromText(const std::string& text);

struct AchievementRule
{
    std::string id;
    std::string name;
    std::string description;
    AchievementKind kind = AchievementKind::FirstPlay;
    int maxProgress = 1;
    double threshold = 0.0; // emotion component threshold for the *Threshold kinds
};

/// Cumulative per-child facts the rules are evaluated against.
struct ChildStats
{
    int sessionsCompleted = 0;
    int streakDays = 0;
    std::set<gameplay::Variant> variantsCompleted;
};

/// Evaluates the rule set after each successful session and keeps progress
/// monotonic: progress = max(existing, computed), unlockedAt set once.
class AchievementSystem
{
public:
    AchievementSystem();

    bool LoadFromJson(const std::string& jsonPath);

    [[nodiscard]] const std::vector<AchievementRule>& GetRules() const { return m_rules; }
    [[nodiscard]] const AchievementRule* FindRule(const std::string& achievementId) const;

    [[nodiscard]] static std::vector<AchievementRule> DefaultRules();
    [[nodiscard]] static int ComputeProgress(
        const AchievementRule& rule,
        const ChildStats& stats,
        const gameplay::EmotionScore& emotion);

    /// @return Records whose progress or unlock state changed.
    std::vector<persistence::AchievementProgress> Evaluate(
        const std::string& childId,
        const ChildStats& stats,
        const gameplay::EmotionScore& emotion,
        const engine::core::CalendarDate& today);

    /// Merges a stored record; never lowers what is already known.
    void Restore(const persistence::AchievementProgress& record);

    [[nodiscard]] std::optional<persistence::AchievementProgress> GetProgress(
        const std::string& childId,
        const std::string& achievementId) const;
    [[nodiscard]] std::vector<persistence::AchievementProgress> GetAllProgress(const std::string& childId) const;
    [[nodiscard]] int CountUnlocked(const std::string& childId) const;

private:
    std::vector<AchievementRule> m_rules;
    std::map<std::pair<std::string, std::string>, persistence::AchievementProgress> m_progress;
};
} // namespace game::progression
