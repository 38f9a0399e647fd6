#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace game::gameplay
{

/// Five-dimensional normalized emotion estimate. Never mutated after creation.
struct EmotionScore
{
    double joy = 0.0;          // [0, 1]
    double frustration = 0.0;  // [0, 1]
    double engagement = 0.0;   // [0, 1]
    double focus = 0.0;        // [0, 1]
    double overall = 0.0;      // [-1, 1]
};

/// Tunable scoring policy. Only the clamped output ranges are a contract;
/// the weights themselves may be retuned from config.
struct EmotionWeights
{
    double timeEfficiencyCap = 2.0;
    double penaltyPerRetry = 0.1;
    double defaultMeanReactionMs = 500.0;
    double neutralConsistency = 0.5;
    double fastThresholdMs = 200.0;
    double reactionWindowMs = 800.0;

    // joy
    double joySuccess = 0.45;
    double joyTime = 0.20;
    double joyRetry = 0.20;
    double joyConsistency = 0.15;

    // frustration
    double frustrationFailure = 0.40;
    double frustrationRetry = 0.25;
    double frustrationRetryScale = 0.2;
    double frustrationTime = 0.20;
    double frustrationInconsistency = 0.15;

    // engagement
    double engagementSpeed = 0.40;
    double engagementConsistency = 0.20;
    double engagementSuccess = 0.20;
    double engagementTime = 0.20;

    // focus
    double focusConsistency = 0.50;
    double focusTime = 0.30;
    double focusRetry = 0.20;
    double focusRetryScale = 0.1;
    double focusRetryCap = 1.0;

    // overall
    double overallJoy = 0.4;
    double overallEngagement = 0.3;
    double overallFocus = 0.3;
    double overallFrustration = 0.8;

    /// Overrides any field present in the JSON file; keeps defaults otherwise.
    bool LoadFromJson(const std::string& jsonPath);
};

/// Intermediate terms, exposed for diagnostics and tests.
struct EmotionFactors
{
    double timeEfficiency = 0.0;
    double timeEfficiencyNormalized = 0.0;
    double retryFactor = 0.0;
    double meanReactionMs = 0.0;
    double reactionConsistency = 0.0;
    double reactionSpeed = 0.0;
};

[[nodiscard]] EmotionFactors ComputeEmotionFactors(
    double completionTimeSeconds,
    double timeLimitSeconds,
    int retryCount,
    const std::vector<double>& reactionSamplesMs,
    const EmotionWeights& weights = EmotionWeights{});

/// Pure mapping from session telemetry to an EmotionScore. Every output is
/// finite and inside its declared range for any input.
[[nodiscard]] EmotionScore ComputeEmotionScore(
    double completionTimeSeconds,
    double timeLimitSeconds,
    int retryCount,
    double successRate,
    const std::vector<double>& reactionSamplesMs,
    const EmotionWeights& weights = EmotionWeights{});

enum class Sentiment : std::uint8_t
{
    Happy,
    Neutral,
    Sad,
    Stressed
};

/// Coarse caregiver-facing label derived from reaction speed and outcome.
[[nodiscard]] Sentiment ClassifySentiment(const std::vector<double>& reactionSamplesMs, int score, bool success);
[[nodiscard]] const char* SentimentToText(Sentiment sentiment);

} // namespace game::gameplay
