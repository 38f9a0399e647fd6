#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "engine/core/CalendarDate.hpp"
#include "engine/core/EventBus.hpp"
#include "engine/core/Time.hpp"
#include "engine/core/TimerQueue.hpp"
#include "game/gameplay/EmotionScoring.hpp"
#include "game/gameplay/LevelCatalog.hpp"
#include "game/gameplay/SessionResult.hpp"
#include "game/gameplay/variants/GameVariant.hpp"
#include "game/persistence/ProfileStore.hpp"
#include "game/progression/ProgressionEngine.hpp"

namespace game::gameplay
{
enum class SessionState : std::uint8_t
{
    Instructions,
    AwaitingStart,
    Active,
    Completed,
    AwaitingRetry,
    Closed
};

[[nodiscard]] const char* SessionStateToText(SessionState state);

/// Directional input tagged with the attempt it was produced for.
struct InputEvent
{
    Direction direction = Direction::Up;
    double timestampMs = 0.0;
    std::uint64_t attemptId = 0;
};

/// What the result screen shows after a successful attempt.
struct SessionSummary
{
    SessionResult result;
    progression::ProgressionUpdate progression;
};

/// Drives one variant through Instructions -> AwaitingStart -> Active ->
/// {Completed | AwaitingRetry}, accumulating retries across attempts of the
/// same level. Everything runs on the caller's thread inside Update().
class SessionController
{
public:
    SessionController(
        const LevelCatalog& catalog,
        progression::ProgressionEngine& progression,
        persistence::ProfileStore& store,
        std::mt19937& rng,
        EmotionWeights weights = EmotionWeights{});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /// Begins a new session. Allowed when no session is running
    /// (Closed or Completed). Unknown level ids fall back to the first level.
    bool Open(const std::string& childId, Variant variant, int levelId, const engine::core::CalendarDate& today);
    bool AcknowledgeInstructions();

    /// Builds a fresh variant and starts it. `nowSeconds` is the host's monotonic clock.
    bool StartAttempt(double nowSeconds);

    /// Queues a directional input for the next Update(). Refused outside Active.
    bool QueueInput(Direction direction, double timestampMs);

    /// Delivers queued inputs, advances timers and runs fixed steps.
    void Update(double nowSeconds);

    bool Retry();

    /// Leaves from any state: cancels every timer and refuses further input.
    void Abandon();

    /// Terminal signal from the running variant. Only the first signal of the
    /// current attempt while Active has any effect.
    void ReportTerminal(std::uint64_t attemptId, int score, bool success);

    [[nodiscard]] SessionState State() const { return m_state; }
    [[nodiscard]] int RetryCount() const { return m_retryCount; }
    [[nodiscard]] std::uint64_t AttemptId() const { return m_attemptId; }
    [[nodiscard]] const Level& GetLevel() const { return m_level; }
    [[nodiscard]] Variant GetVariantKind() const { return m_variantKind; }
    [[nodiscard]] const std::string& ChildId() const { return m_childId; }
    [[nodiscard]] const std::vector<double>& ReactionSamples() const { return m_reactionSamples; }
    [[nodiscard]] std::size_t PendingTimerCount() const { return m_timers.PendingCount(); }
    [[nodiscard]] int IgnoredTerminalSignals() const { return m_ignoredTerminals; }

    /// Running variant of the current attempt, if any.
    [[nodiscard]] GameVariant* CurrentVariant() { return m_variant.get(); }
    [[nodiscard]] const GameVariant* CurrentVariant() const { return m_variant.get(); }

    /// Available in Completed only.
    [[nodiscard]] std::optional<SessionSummary> GetSummary() const;

    /// Most recent persistence failure of this session, for the UI layer's retry decision.
    [[nodiscard]] const std::optional<std::string>& LastPersistError() const { return m_lastPersistError; }

private:
    void OnInputEvent(const InputEvent& event);
    void CompleteSession(int score);
    void OnPersisted(const persistence::PersistResult& result);
    void TearDownAttempt();

    static constexpr double kMinCompletionSeconds = 1.0e-3;

    const LevelCatalog& m_catalog;
    progression::ProgressionEngine& m_progression;
    persistence::ProfileStore& m_store;
    std::mt19937& m_rng;
    EmotionWeights m_weights;

    engine::core::Time m_time;
    engine::core::EventBus<InputEvent> m_inputs;
    // Declared before the variant so the variant can still cancel its timers on destruction.
    engine::core::TimerQueue m_timers;
    std::unique_ptr<GameVariant> m_variant;

    SessionState m_state = SessionState::Closed;
    std::string m_childId;
    Variant m_variantKind = Variant::Runner;
    Level m_level;
    engine::core::CalendarDate m_today;

    int m_retryCount = 0;
    std::uint64_t m_attemptId = 0;
    bool m_terminalLatched = false;
    int m_ignoredTerminals = 0;
    std::vector<double> m_reactionSamples;

    std::optional<SessionSummary> m_summary;
    std::optional<std::string> m_lastPersistError;
};
} // namespace game::gameplay
