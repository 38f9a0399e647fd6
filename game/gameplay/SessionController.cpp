#include "game/gameplay/SessionController.hpp"

#include <algorithm>
#include <iostream>

namespace game::gameplay
{
const char* SessionStateToText(SessionState state)
{
    switch (state)
    {
        case SessionState::Instructions: return "instructions";
        case SessionState::AwaitingStart: return "awaiting-start";
        case SessionState::Active: return "active";
        case SessionState::Completed: return "completed";
        case SessionState::AwaitingRetry: return "awaiting-retry";
        case SessionState::Closed: return "closed";
        default: return "unknown";
    }
}

SessionController::SessionController(
    const LevelCatalog& catalog,
    progression::ProgressionEngine& progression,
    persistence::ProfileStore& store,
    std::mt19937& rng,
    EmotionWeights weights)
    : m_catalog(catalog)
    , m_progression(progression)
    , m_store(store)
    , m_rng(rng)
    , m_weights(weights)
{
    m_inputs.Subscribe([this](const InputEvent& event) { OnInputEvent(event); });
}

SessionController::~SessionController()
{
    TearDownAttempt();
}

bool SessionController::Open(
    const std::string& childId,
    Variant variant,
    int levelId,
    const engine::core::CalendarDate& today)
{
    if (m_state != SessionState::Closed && m_state != SessionState::Completed)
    {
        std::cout << "SessionController: WARNING - Open refused while " << SessionStateToText(m_state) << "\n";
        return false;
    }

    TearDownAttempt();
    m_childId = childId;
    m_variantKind = variant;
    m_level = m_catalog.GetLevel(variant, levelId);
    m_today = today;
    m_retryCount = 0;
    m_reactionSamples.clear();
    m_summary.reset();
    m_lastPersistError.reset();
    m_state = SessionState::Instructions;

    std::cout << "SessionController: Opened " << VariantToText(variant) << " level " << m_level.id << " ("
              << m_level.displayName << ") for " << childId << "\n";
    return true;
}

bool SessionController::AcknowledgeInstructions()
{
    if (m_state != SessionState::Instructions)
    {
        return false;
    }
    m_state = SessionState::AwaitingStart;
    return true;
}

bool SessionController::StartAttempt(double nowSeconds)
{
    if (m_state != SessionState::AwaitingStart)
    {
        return false;
    }

    TearDownAttempt();

    ++m_attemptId;
    m_terminalLatched = false;
    m_reactionSamples.clear();
    m_time.Reset();
    m_time.BeginFrame(nowSeconds);

    m_variant = CreateVariant(m_variantKind, m_level, m_timers, m_rng);
    if (!m_variant)
    {
        return false;
    }

    const std::uint64_t attemptId = m_attemptId;
    m_variant->SetTerminalCallback([this, attemptId](int score, bool success) {
        ReportTerminal(attemptId, score, success);
    });
    m_variant->SetReactionCallback([this, attemptId](double latencyMs) {
        if (attemptId == m_attemptId && m_state == SessionState::Active)
        {
            m_reactionSamples.push_back(latencyMs);
        }
    });

    m_state = SessionState::Active;
    std::cout << "SessionController: Attempt " << m_attemptId << " started (retries so far: " << m_retryCount << ")\n";
    m_variant->Start();
    return true;
}

bool SessionController::QueueInput(Direction direction, double timestampMs)
{
    if (m_state != SessionState::Active)
    {
        return false;
    }
    m_inputs.Publish(InputEvent{direction, timestampMs, m_attemptId});
    return true;
}

void SessionController::Update(double nowSeconds)
{
    if (m_state != SessionState::Active)
    {
        return;
    }

    m_time.BeginFrame(nowSeconds);
    m_inputs.DispatchQueued();

    if (m_state == SessionState::Active)
    {
        m_timers.Advance(m_time.DeltaSeconds());
    }

    while (m_time.ShouldRunFixedStep())
    {
        if (m_state == SessionState::Active && m_variant)
        {
            m_variant->FixedUpdate(m_time.FixedDeltaSeconds());
        }
        m_time.ConsumeFixedStep();
    }
}

void SessionController::OnInputEvent(const InputEvent& event)
{
    if (event.attemptId != m_attemptId || m_state != SessionState::Active || !m_variant)
    {
        return;
    }
    m_variant->HandleInput(event.direction, event.timestampMs);
}

void SessionController::ReportTerminal(std::uint64_t attemptId, int score, bool success)
{
    if (m_terminalLatched || attemptId != m_attemptId || m_state != SessionState::Active)
    {
        ++m_ignoredTerminals;
        std::cout << "SessionController: Ignored terminal signal for attempt " << attemptId << " while "
                  << SessionStateToText(m_state) << "\n";
        return;
    }
    m_terminalLatched = true;
    m_timers.CancelAll();
    m_inputs.Clear();

    std::cout << "SessionController: Attempt " << attemptId << (success ? " succeeded" : " failed")
              << " with score " << score << "\n";

    if (success)
    {
        CompleteSession(score);
    }
    else
    {
        m_state = SessionState::AwaitingRetry;
    }
}

void SessionController::CompleteSession(int score)
{
    SessionResult result;
    result.childId = m_childId;
    result.variant = m_variantKind;
    result.levelId = m_level.id;
    result.score = score;
    // Simulated time, the clock the countdown runs on.
    result.completionTimeSeconds = std::max(m_time.SimulatedSeconds(), kMinCompletionSeconds);
    if (m_time.DroppedSeconds() > 0.0)
    {
        std::cout << "SessionController: WARNING - " << m_time.DroppedSeconds()
                  << "s of stalled frames were not simulated or counted\n";
    }
    result.retryCount = m_retryCount;
    result.successRate = std::clamp(static_cast<double>(score) / 100.0, 0.0, 1.0);
    result.reactionSamplesMs = m_reactionSamples;
    result.emotion = ComputeEmotionScore(
        result.completionTimeSeconds,
        static_cast<double>(m_level.timeLimitSeconds),
        result.retryCount,
        result.successRate,
        result.reactionSamplesMs,
        m_weights);
    result.sentiment = ClassifySentiment(result.reactionSamplesMs, score, true);
    result.playedOn = m_today;

    m_state = SessionState::Completed;

    const auto onPersisted = [this](const persistence::PersistResult& persisted) { OnPersisted(persisted); };
    m_store.SaveSessionResult(result, onPersisted);

    SessionSummary summary;
    summary.progression = m_progression.RecordSession(result, onPersisted);
    summary.result = std::move(result);
    m_summary = std::move(summary);
}

void SessionController::OnPersisted(const persistence::PersistResult& result)
{
    if (result.ok)
    {
        return;
    }
    m_lastPersistError = result.error;
    std::cout << "SessionController: WARNING - Persistence failed: " << result.error << "\n";
}

bool SessionController::Retry()
{
    if (m_state != SessionState::AwaitingRetry)
    {
        return false;
    }
    ++m_retryCount;
    m_state = SessionState::AwaitingStart;
    return true;
}

void SessionController::Abandon()
{
    if (m_state == SessionState::Closed)
    {
        return;
    }
    TearDownAttempt();
    m_state = SessionState::Closed;
    std::cout << "SessionController: Session abandoned\n";
}

void SessionController::TearDownAttempt()
{
    if (m_variant)
    {
        m_variant->Stop();
    }
    m_timers.CancelAll();
    m_inputs.Clear();
    m_variant.reset();
}

std::optional<SessionSummary> SessionController::GetSummary() const
{
    if (m_state != SessionState::Completed)
    {
        return std::nullopt;
    }
    return m_summary;
}
} // namespace game::gameplay
