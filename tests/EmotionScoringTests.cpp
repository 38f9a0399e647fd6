#include <gtest/gtest.h>

#include "game/gameplay/EmotionScoring.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <vector>

using namespace game::gameplay;

namespace
{
void ExpectInRange(const EmotionScore& score)
{
    for (double component : {score.joy, score.frustration, score.engagement, score.focus})
    {
        ASSERT_TRUE(std::isfinite(component));
        EXPECT_GE(component, 0.0);
        EXPECT_LE(component, 1.0);
    }
    ASSERT_TRUE(std::isfinite(score.overall));
    EXPECT_GE(score.overall, -1.0);
    EXPECT_LE(score.overall, 1.0);
}
} // namespace

TEST(EmotionScoringTest, KnownInputsGiveKnownScores)
{
    const EmotionScore score = ComputeEmotionScore(30.0, 60.0, 0, 1.0, {});
    EXPECT_NEAR(score.joy, 0.925, 1e-9);
    EXPECT_NEAR(score.frustration, 0.075, 1e-9);
    EXPECT_NEAR(score.engagement, 0.75, 1e-9);
    EXPECT_NEAR(score.focus, 0.75, 1e-9);
    EXPECT_NEAR(score.overall, 0.76, 1e-9);
}

TEST(EmotionScoringTest, EmptySamplesUseDefaultMean)
{
    const EmotionFactors factors = ComputeEmotionFactors(30.0, 60.0, 0, {});
    EXPECT_DOUBLE_EQ(factors.meanReactionMs, 500.0);
    EXPECT_DOUBLE_EQ(factors.reactionConsistency, 0.5);
    EXPECT_DOUBLE_EQ(factors.timeEfficiency, 2.0);
    EXPECT_DOUBLE_EQ(factors.timeEfficiencyNormalized, 1.0);
}

TEST(EmotionScoringTest, SingleSampleIsNeutrallyConsistent)
{
    const EmotionFactors factors = ComputeEmotionFactors(30.0, 60.0, 0, {250.0});
    EXPECT_DOUBLE_EQ(factors.meanReactionMs, 250.0);
    EXPECT_DOUBLE_EQ(factors.reactionConsistency, 0.5);
}

TEST(EmotionScoringTest, IdenticalSamplesArePerfectlyConsistent)
{
    const EmotionFactors factors = ComputeEmotionFactors(30.0, 60.0, 0, {300.0, 300.0, 300.0});
    EXPECT_DOUBLE_EQ(factors.reactionConsistency, 1.0);
    EXPECT_NEAR(factors.reactionSpeed, 0.875, 1e-12);
}

TEST(EmotionScoringTest, AllZeroSamplesStayFinite)
{
    const EmotionScore score = ComputeEmotionScore(10.0, 60.0, 0, 1.0, {0.0, 0.0, 0.0});
    ExpectInRange(score);
    EXPECT_DOUBLE_EQ(ComputeEmotionFactors(10.0, 60.0, 0, {0.0, 0.0}).reactionConsistency, 1.0);
}

TEST(EmotionScoringTest, RetriesRaiseFrustrationAndLowerJoy)
{
    const EmotionScore clean = ComputeEmotionScore(40.0, 60.0, 0, 0.8, {400.0, 500.0});
    const EmotionScore retried = ComputeEmotionScore(40.0, 60.0, 4, 0.8, {400.0, 500.0});
    EXPECT_GT(retried.frustration, clean.frustration);
    EXPECT_LT(retried.joy, clean.joy);
    EXPECT_LT(retried.focus, clean.focus);
}

TEST(EmotionScoringTest, AllOutputsStayInRangeAcrossInputGrid)
{
    const std::vector<double> completions = {1e-9, 0.5, 30.0, 60.0, 600.0, 1e9};
    const std::vector<double> limits = {1e-9, 1.0, 45.0, 90.0, 1e9};
    const std::vector<int> retries = {0, 1, 5, 10, 1000};
    const std::vector<double> rates = {0.0, 0.25, 0.5, 1.0};
    const std::vector<std::vector<double>> sampleSets = {
        {},
        {0.0},
        {0.0, 0.0},
        {1e-9, 1e9},
        {150.0, 2000.0, 90.0, 4000.0},
        {200.0, 200.0, 200.0},
    };

    for (double completion : completions)
        for (double limit : limits)
            for (int retry : retries)
                for (double rate : rates)
                    for (const auto& samples : sampleSets)
                    {
                        ExpectInRange(ComputeEmotionScore(completion, limit, retry, rate, samples));
                    }
}

TEST(EmotionScoringTest, NonFiniteInputsAreSanitized)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    ExpectInRange(ComputeEmotionScore(nan, 60.0, 0, 1.0, {100.0, nan, inf}));
    ExpectInRange(ComputeEmotionScore(0.0, inf, -3, nan, {}));
    ExpectInRange(ComputeEmotionScore(-5.0, -5.0, 2, 2.0, {-50.0, 100.0}));
}

TEST(EmotionScoringTest, IsDeterministic)
{
    const std::vector<double> samples = {320.0, 410.0, 290.0};
    const EmotionScore a = ComputeEmotionScore(25.0, 60.0, 1, 0.9, samples);
    const EmotionScore b = ComputeEmotionScore(25.0, 60.0, 1, 0.9, samples);
    EXPECT_EQ(a.joy, b.joy);
    EXPECT_EQ(a.frustration, b.frustration);
    EXPECT_EQ(a.engagement, b.engagement);
    EXPECT_EQ(a.focus, b.focus);
    EXPECT_EQ(a.overall, b.overall);
}

TEST(SentimentTest, ClassifiesByOutcomeAndSpeed)
{
    EXPECT_EQ(ClassifySentiment({100.0, 200.0}, 100, true), Sentiment::Happy);
    EXPECT_EQ(ClassifySentiment({}, 100, true), Sentiment::Happy);
    EXPECT_EQ(ClassifySentiment({500.0}, 100, true), Sentiment::Neutral);
    EXPECT_EQ(ClassifySentiment({100.0}, 60, true), Sentiment::Neutral);
    EXPECT_EQ(ClassifySentiment({1500.0}, 20, false), Sentiment::Stressed);
    EXPECT_EQ(ClassifySentiment({500.0}, 20, false), Sentiment::Sad);
    EXPECT_STREQ(SentimentToText(Sentiment::Stressed), "stressed");
}

TEST(EmotionWeightsTest, LoadsOverridesAndKeepsDefaults)
{
    const auto path = std::filesystem::temp_directory_path() / "mindbloom_weights_test.json";
    {
        std::ofstream file(path);
        file << R"({"penalty_per_retry": 0.25, "joy": {"success": 0.5}})";
    }

    EmotionWeights weights;
    EXPECT_TRUE(weights.LoadFromJson(path.string()));
    EXPECT_DOUBLE_EQ(weights.penaltyPerRetry, 0.25);
    EXPECT_DOUBLE_EQ(weights.joySuccess, 0.5);
    EXPECT_DOUBLE_EQ(weights.joyTime, 0.2);
    EXPECT_DOUBLE_EQ(weights.timeEfficiencyCap, 2.0);
    std::filesystem::remove(path);
}

TEST(EmotionWeightsTest, MissingOrBrokenFileKeepsDefaults)
{
    EmotionWeights weights;
    EXPECT_FALSE(weights.LoadFromJson("/nonexistent/emotion_weights.json"));

    const auto path = std::filesystem::temp_directory_path() / "mindbloom_weights_broken.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    EXPECT_FALSE(weights.LoadFromJson(path.string()));
    EXPECT_DOUBLE_EQ(weights.penaltyPerRetry, 0.1);
    std::filesystem::remove(path);
}

TEST(EmotionWeightsTest, ShippedConfigMatchesDefaults)
{
    EmotionWeights weights;
    ASSERT_TRUE(weights.LoadFromJson(std::string(MINDBLOOM_CONFIG_DIR) + "/emotion_weights.json"));
    const EmotionScore loaded = ComputeEmotionScore(30.0, 60.0, 0, 1.0, {}, weights);
    EXPECT_NEAR(loaded.overall, 0.76, 1e-9);
}
