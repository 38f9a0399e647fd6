#include "game/gameplay/EmotionScoring.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <numeric>

#include <nlohmann/json.hpp>

namespace game::gameplay
{
namespace
{
constexpr double kMinCompletionSeconds = 1.0e-3;
constexpr double kEpsilon = 1.0e-9;

/// Clamp that also maps NaN to the lower bound and infinities to the nearer bound.
[[nodiscard]] double SafeClamp(double value, double lo, double hi)
{
    if (std::isnan(value))
    {
        return lo;
    }
    return std::clamp(value, lo, hi);
}

[[nodiscard]] double FiniteOr(double value, double fallback)
{
    return std::isfinite(value) ? value : fallback;
}

[[nodiscard]] std::vector<double> FiniteSamples(const std::vector<double>& samples)
{
    std::vector<double> finite;
    finite.reserve(samples.size());
    for (double sample : samples)
    {
        if (std::isfinite(sample))
        {
            finite.push_back(std::max(sample, 0.0));
        }
    }
    return finite;
}

[[nodiscard]] double Mean(const std::vector<double>& samples)
{
    return std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());
}

[[nodiscard]] double StandardDeviation(const std::vector<double>& samples, double mean)
{
    double sumSquares = 0.0;
    for (double sample : samples)
    {
        const double diff = sample - mean;
        sumSquares += diff * diff;
    }
    return std::sqrt(sumSquares / static_cast<double>(samples.size()));
}

void ReadWeight(const nlohmann::json& root, const char* key, double& field)
{
    if (root.contains(key) && root[key].is_number())
    {
        field = root[key].get<double>();
    }
}
} // namespace

EmotionFactors ComputeEmotionFactors(
    double completionTimeSeconds,
    double timeLimitSeconds,
    int retryCount,
    const std::vector<double>& reactionSamplesMs,
    const EmotionWeights& weights)
{
    EmotionFactors factors;

    const double completion = std::max(FiniteOr(completionTimeSeconds, kMinCompletionSeconds), kMinCompletionSeconds);
    const double limit = std::max(FiniteOr(timeLimitSeconds, 0.0), 0.0);
    const double cap = std::max(weights.timeEfficiencyCap, kEpsilon);

    factors.timeEfficiency = SafeClamp(limit / completion, 0.0, cap);
    factors.timeEfficiencyNormalized = SafeClamp(factors.timeEfficiency / cap, 0.0, 1.0);

    const double retries = static_cast<double>(std::max(retryCount, 0));
    factors.retryFactor = SafeClamp(1.0 - retries * weights.penaltyPerRetry, 0.0, 1.0);

    const std::vector<double> samples = FiniteSamples(reactionSamplesMs);
    factors.meanReactionMs = samples.empty() ? weights.defaultMeanReactionMs : Mean(samples);

    if (samples.size() >= 2)
    {
        const double deviation = StandardDeviation(samples, factors.meanReactionMs);
        if (factors.meanReactionMs <= kEpsilon)
        {
            // All-zero latencies are perfectly consistent.
            factors.reactionConsistency = deviation <= kEpsilon ? 1.0 : 0.0;
        }
        else
        {
            factors.reactionConsistency = SafeClamp(1.0 - deviation / factors.meanReactionMs, 0.0, 1.0);
        }
    }
    else
    {
        factors.reactionConsistency = SafeClamp(weights.neutralConsistency, 0.0, 1.0);
    }

    const double window = std::max(weights.reactionWindowMs, kEpsilon);
    factors.reactionSpeed = SafeClamp(1.0 - (factors.meanReactionMs - weights.fastThresholdMs) / window, 0.0, 1.0);
    return factors;
}

EmotionScore ComputeEmotionScore(
    double completionTimeSeconds,
    double timeLimitSeconds,
    int retryCount,
    double successRate,
    const std::vector<double>& reactionSamplesMs,
    const EmotionWeights& weights)
{
    const EmotionFactors f = ComputeEmotionFactors(
        completionTimeSeconds, timeLimitSeconds, retryCount, reactionSamplesMs, weights);

    const double rate = SafeClamp(successRate, 0.0, 1.0);
    const double retries = static_cast<double>(std::max(retryCount, 0));
    const double timeClamped = std::min(f.timeEfficiency, 1.0);

    const double joy = weights.joySuccess * rate
        + weights.joyTime * f.timeEfficiencyNormalized
        + weights.joyRetry * f.retryFactor
        + weights.joyConsistency * f.reactionConsistency;

    const double frustration = weights.frustrationFailure * (1.0 - rate)
        + weights.frustrationRetry * std::min(retries * weights.frustrationRetryScale, 1.0)
        + weights.frustrationTime * (1.0 - timeClamped)
        + weights.frustrationInconsistency * (1.0 - f.reactionConsistency);

    const double engagement = weights.engagementSpeed * f.reactionSpeed
        + weights.engagementConsistency * f.reactionConsistency
        + weights.engagementSuccess * rate
        + weights.engagementTime * timeClamped;

    const double focus = weights.focusConsistency * f.reactionConsistency
        + weights.focusTime * f.timeEfficiencyNormalized
        + weights.focusRetry * (1.0 - std::min(retries * weights.focusRetryScale, weights.focusRetryCap));

    EmotionScore score;
    score.joy = SafeClamp(joy, 0.0, 1.0);
    score.frustration = SafeClamp(frustration, 0.0, 1.0);
    score.engagement = SafeClamp(engagement, 0.0, 1.0);
    score.focus = SafeClamp(focus, 0.0, 1.0);

    const double overall = weights.overallJoy * score.joy
        + weights.overallEngagement * score.engagement
        + weights.overallFocus * score.focus
        - weights.overallFrustration * score.frustration;
    score.overall = SafeClamp(overall, -1.0, 1.0);
    return score;
}

bool EmotionWeights::LoadFromJson(const std::string& jsonPath)
{
    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cout << "EmotionWeights: WARNING - Could not open '" << jsonPath << "', using defaults\n";
        return false;
    }

    try
    {
        nlohmann::json root;
        file >> root;

        ReadWeight(root, "time_efficiency_cap", timeEfficiencyCap);
        ReadWeight(root, "penalty_per_retry", penaltyPerRetry);
        ReadWeight(root, "default_mean_reaction_ms", defaultMeanReactionMs);
        ReadWeight(root, "neutral_consistency", neutralConsistency);
        ReadWeight(root, "fast_threshold_ms", fastThresholdMs);
        ReadWeight(root, "reaction_window_ms", reactionWindowMs);

        if (root.contains("joy"))
        {
            const auto& j = root["joy"];
            ReadWeight(j, "success", joySuccess);
            ReadWeight(j, "time", joyTime);
            ReadWeight(j, "retry", joyRetry);
            ReadWeight(j, "consistency", joyConsistency);
        }
        if (root.contains("frustration"))
        {
            const auto& j = root["frustration"];
            ReadWeight(j, "failure", frustrationFailure);
            ReadWeight(j, "retry", frustrationRetry);
            ReadWeight(j, "retry_scale", frustrationRetryScale);
            ReadWeight(j, "time", frustrationTime);
            ReadWeight(j, "inconsistency", frustrationInconsistency);
        }
        if (root.contains("engagement"))
        {
            const auto& j = root["engagement"];
            ReadWeight(j, "speed", engagementSpeed);
            ReadWeight(j, "consistency", engagementConsistency);
            ReadWeight(j, "success", engagementSuccess);
            ReadWeight(j, "time", engagementTime);
        }
        if (root.contains("focus"))
        {
            const auto& j = root["focus"];
            ReadWeight(j, "consistency", focusConsistency);
            ReadWeight(j, "time", focusTime);
            ReadWeight(j, "retry", focusRetry);
            ReadWeight(j, "retry_scale", focusRetryScale);
            ReadWeight(j, "retry_cap", focusRetryCap);
        }
        if (root.contains("overall"))
        {
            const auto& j = root["overall"];
            ReadWeight(j, "joy", overallJoy);
            ReadWeight(j, "engagement", overallEngagement);
            ReadWeight(j, "focus", overallFocus);
            ReadWeight(j, "frustration", overallFrustration);
        }

        std::cout << "EmotionWeights: Loaded scoring policy from " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "EmotionWeights: ERROR - Failed to load '" << jsonPath << "': " << e.what() << "\n";
        return false;
    }
}

Sentiment ClassifySentiment(const std::vector<double>& reactionSamplesMs, int score, bool success)
{
    const std::vector<double> samples = FiniteSamples(reactionSamplesMs);
    const double mean = samples.empty() ? 0.0 : Mean(samples);

    if (success && score >= 100 && mean < 300.0)
    {
        return Sentiment::Happy;
    }
    if (!success && mean > 1000.0)
    {
        return Sentiment::Stressed;
    }
    if (!success)
    {
        return Sentiment::Sad;
    }
    return Sentiment::Neutral;
}

const char* SentimentToText(Sentiment sentiment)
{
    switch (sentiment)
    {
        case Sentiment::Happy: return "happy";
        case Sentiment::Neutral: return "neutral";
        case Sentiment::Sad: return "sad";
        case Sentiment::Stressed: return "stressed";
        default: return "unknown";
    }
}

} // namespace game::gameplay
