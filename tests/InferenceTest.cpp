/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>

#include "TestHelpers.hpp"
#include "inference/DualPath.hpp"
#include "inference/FeatureVector.hpp"
#include "inference/InferencePaths.hpp"
#include "inference/ModelProvider.hpp"

namespace
{
    /// @brief Creates a fake model, or fails for the ids in failing
    class CountingModelProvider : public ModelProvider
    {
    protected:
        std::shared_ptr<IInferenceModel> createModel(const ModelId id) override
        {
            createCount++;
            if (id == failing) return nullptr;
            return std::make_shared<FakeInferenceModel>();
        }

    public:
        ModelId failing;
        int createCount{0};

        CountingModelProvider(const bool enabled, const ModelId failing) : ModelProvider(enabled), failing(failing){};
    };

    std::shared_ptr<FakeInferenceModel> modelWith(const std::string &output, const std::vector<float> &values)
    {
        std::shared_ptr<FakeInferenceModel> model = std::make_shared<FakeInferenceModel>();
        model->outputs[output] = values;
        return model;
    }

    DualPath<double>::RuleFunction constantRule(const double value)
    {
        return [value]() { return value; };
    }
}

TEST(FeatureVectorTest, AbsentValuesUseTheSentinel)
{
    const std::optional<FeatureVector> features = FeatureVector::Create({1.5, std::nullopt, 3.0}, 3);
    ASSERT_TRUE(features.has_value());
    ASSERT_EQ(features->Size(), 3u);
    EXPECT_FLOAT_EQ(features->Values()[0], 1.5f);
    EXPECT_FLOAT_EQ(features->Values()[1], -1.0f);
    EXPECT_FLOAT_EQ(features->Values()[2], 3.0f);
}

TEST(FeatureVectorTest, RejectsWrongLengthAndNonFiniteValues)
{
    EXPECT_FALSE(FeatureVector::Create({1.0, 2.0}, 3).has_value());
    EXPECT_FALSE(FeatureVector::Create({1.0, std::numeric_limits<double>::quiet_NaN()}, 2).has_value());
    EXPECT_FALSE(FeatureVector::Create({std::numeric_limits<double>::infinity()}, 1).has_value());
    EXPECT_TRUE(FeatureVector::Create({}, 0).has_value());
}

TEST(ModelCatalogTest, DescribesTheBundledModels)
{
    EXPECT_EQ(ModelCatalog::Name(ModelId::GaitPatternClassifier), "GaitPatternClassifier");
    EXPECT_EQ(ModelCatalog::Name(ModelId::PostureScorer), "PostureScorer");
    EXPECT_EQ(ModelCatalog::Name(ModelId::FallRiskPredictor), "FallRiskPredictor");

    EXPECT_EQ(ModelCatalog::FeatureCount(ModelId::GaitPatternClassifier), 14u);
    EXPECT_EQ(ModelCatalog::FeatureCount(ModelId::PostureScorer), 9u);
    EXPECT_EQ(ModelCatalog::FeatureCount(ModelId::FallRiskPredictor), 8u);

    EXPECT_EQ(ModelCatalog::OutputName(ModelId::GaitPatternClassifier), "classProbability");
    EXPECT_EQ(ModelCatalog::OutputName(ModelId::PostureScorer), "compositeScore");
    EXPECT_EQ(ModelCatalog::OutputName(ModelId::FallRiskPredictor), "riskScore");
    EXPECT_EQ(ModelCatalog::MODEL_VERSION, "1.0.0");
}

TEST(ModelProviderTest, CachesLoadedModels)
{
    CountingModelProvider provider(true, ModelId::FallRiskPredictor);

    const std::shared_ptr<IInferenceModel> first = provider.LoadModel(ModelId::PostureScorer);
    const std::shared_ptr<IInferenceModel> second = provider.LoadModel(ModelId::PostureScorer);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(provider.createCount, 1);
    EXPECT_FALSE(provider.HasFailed(ModelId::PostureScorer));
}

TEST(ModelProviderTest, FailedModelIsNotRetried)
{
    CountingModelProvider provider(true, ModelId::FallRiskPredictor);

    EXPECT_EQ(provider.LoadModel(ModelId::FallRiskPredictor), nullptr);
    EXPECT_EQ(provider.LoadModel(ModelId::FallRiskPredictor), nullptr);
    EXPECT_EQ(provider.createCount, 1);
    EXPECT_TRUE(provider.HasFailed(ModelId::FallRiskPredictor));

    EXPECT_TRUE(provider.IsEnabled());
    provider.SetEnabled(false);
    EXPECT_FALSE(provider.IsEnabled());
}

TEST(DualPathTest, RuleResultWithoutProvider)
{
    ResultPath path = ResultPath::Inference;
    const DualPath<double> dualPath(nullptr, ModelId::PostureScorer);
    const double result = dualPath.Run(
        constantRule(42.0), [](IInferenceModel &, const double &) { return std::optional<double>(7.0); }, path);
    EXPECT_EQ(result, 42.0);
    EXPECT_EQ(path, ResultPath::RuleBased);
}

TEST(DualPathTest, DisabledProviderIsNotAsked)
{
    std::shared_ptr<FakeModelProvider> provider =
        std::make_shared<FakeModelProvider>(false, std::make_shared<FakeInferenceModel>());
    const DualPath<double> dualPath(provider, ModelId::PostureScorer);

    ResultPath path;
    EXPECT_EQ(dualPath.Run(constantRule(42.0),
                           [](IInferenceModel &, const double &) { return std::optional<double>(7.0); }, path),
              42.0);
    EXPECT_EQ(path, ResultPath::RuleBased);
    EXPECT_EQ(provider->loadCount, 0);
}

TEST(DualPathTest, InferenceReplacesTheRuleResult)
{
    std::shared_ptr<FakeModelProvider> provider =
        std::make_shared<FakeModelProvider>(true, std::make_shared<FakeInferenceModel>());
    const DualPath<double> dualPath(provider, ModelId::PostureScorer);

    ResultPath path;
    double seenRule = 0.0;
    const double result = dualPath.Run(
        constantRule(42.0),
        [&seenRule](IInferenceModel &, const double &rule) {
            seenRule = rule;
            return std::optional<double>(7.0);
        },
        path);
    EXPECT_EQ(result, 7.0);
    EXPECT_EQ(seenRule, 42.0);
    EXPECT_EQ(path, ResultPath::Inference);
}

TEST(DualPathTest, FallsBackOnEveryFailure)
{
    const DualPath<double>::InferenceFunction throwing = [](IInferenceModel &, const double &) -> std::optional<double> {
        throw std::runtime_error("execution failed");
    };
    const DualPath<double>::InferenceFunction invalid = [](IInferenceModel &, const double &) {
        return std::optional<double>();
    };
    ResultPath path;

    std::shared_ptr<FakeModelProvider> noModel = std::make_shared<FakeModelProvider>(true, nullptr);
    EXPECT_EQ(DualPath<double>(noModel, ModelId::PostureScorer).Run(constantRule(1.0), invalid, path), 1.0);
    EXPECT_EQ(path, ResultPath::RuleBased);
    EXPECT_EQ(noModel->loadCount, 1);

    std::shared_ptr<FakeModelProvider> provider =
        std::make_shared<FakeModelProvider>(true, std::make_shared<FakeInferenceModel>());
    const DualPath<double> dualPath(provider, ModelId::PostureScorer);
    EXPECT_EQ(dualPath.Run(constantRule(2.0), invalid, path), 2.0);
    EXPECT_EQ(path, ResultPath::RuleBased);
    EXPECT_EQ(dualPath.Run(constantRule(3.0), throwing, path), 3.0);
    EXPECT_EQ(path, ResultPath::RuleBased);
}

TEST(InferencePathsTest, GaitPatternFromProbabilities)
{
    std::shared_ptr<FakeInferenceModel> model =
        modelWith("classProbability", {0.1f, 0.05f, 0.7f, 0.05f, 0.0f, 0.05f, 0.05f, 0.0f});
    GaitPatternInput input;
    input.cadenceSPM = 110.0;
    GaitPatternResult rule;
    rule.flags = {"Pelvic drop"};

    const std::optional<GaitPatternResult> result = InferencePaths::PredictGaitPattern(*model, input, rule);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->primaryPattern, GaitPatternType::Trendelenburg);
    EXPECT_NEAR(result->confidence, 0.7, 1e-6);
    EXPECT_EQ(result->patternScores.size(), NUM_GAIT_PATTERNS);
    EXPECT_EQ(result->flags, rule.flags);

    ASSERT_EQ(model->lastFeatures.size(), 14u);
    EXPECT_FLOAT_EQ(model->lastFeatures[4], 110.0f);
    EXPECT_FLOAT_EQ(model->lastFeatures[0], -1.0f);
}

TEST(InferencePathsTest, ShortProbabilityOutputCountsMissingClassesAsZero)
{
    std::shared_ptr<FakeInferenceModel> model = modelWith("classProbability", {0.2f, 0.8f});
    const std::optional<GaitPatternResult> result =
        InferencePaths::PredictGaitPattern(*model, GaitPatternInput(), GaitPatternResult());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->primaryPattern, GaitPatternType::Antalgic);
    EXPECT_EQ(result->patternScores.at(GaitPatternType::StiffKnee), 0.0);
}

TEST(InferencePathsTest, MissingOutputThrows)
{
    std::shared_ptr<FakeInferenceModel> model = modelWith("otherTensor", {1.0f});
    EXPECT_THROW(InferencePaths::PredictGaitPattern(*model, GaitPatternInput(), GaitPatternResult()),
                 std::runtime_error);

    std::shared_ptr<FakeInferenceModel> empty = modelWith("compositeScore", {});
    EXPECT_THROW(InferencePaths::PredictPostureScore(*empty, PostureScore()), std::runtime_error);
}

TEST(InferencePathsTest, PostureScoreIsClampedAndKeepsSubScores)
{
    PostureScore rule;
    rule.compositeScore = 80.0;
    rule.subScores = {{"cva", 100.0}, {"kyphosis", 50.0}};

    std::shared_ptr<FakeInferenceModel> model = modelWith("compositeScore", {120.0f});
    const std::optional<PostureScore> result = InferencePaths::PredictPostureScore(*model, rule);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->compositeScore, 100.0);
    EXPECT_EQ(result->subScores, rule.subScores);

    // factor order: cva, sva, trunk, lateral, shoulder, kyphosis, pelvic, lordosis, coronal
    ASSERT_EQ(model->lastFeatures.size(), 9u);
    EXPECT_FLOAT_EQ(model->lastFeatures[0], 100.0f);
    EXPECT_FLOAT_EQ(model->lastFeatures[1], -1.0f);
    EXPECT_FLOAT_EQ(model->lastFeatures[5], 50.0f);
}

TEST(InferencePathsTest, FallRiskLevelFollowsThePredictedScore)
{
    FallRiskInput input;
    input.walkingSpeedMPS = 0.7;
    FallRiskAssessment rule;
    rule.compositeScore = 20.0;
    rule.riskFactorCount = 1;

    std::shared_ptr<FakeInferenceModel> model = modelWith("riskScore", {65.0f});
    const std::optional<FallRiskAssessment> high = InferencePaths::PredictFallRisk(*model, input, rule);
    ASSERT_TRUE(high.has_value());
    EXPECT_NEAR(high->compositeScore, 65.0, 1e-6);
    EXPECT_EQ(high->riskLevel, FallRiskLevel::High);
    EXPECT_EQ(high->riskFactorCount, 1);
    ASSERT_EQ(model->lastFeatures.size(), 8u);
    EXPECT_FLOAT_EQ(model->lastFeatures[0], 0.7f);

    model->outputs["riskScore"] = {-5.0f};
    const std::optional<FallRiskAssessment> low = InferencePaths::PredictFallRisk(*model, input, rule);
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(low->compositeScore, 0.0);
    EXPECT_EQ(low->riskLevel, FallRiskLevel::Low);
}

TEST(InferencePathsTest, NonFiniteFeatureFallsBackToTheRule)
{
    FallRiskInput input;
    input.walkingSpeedMPS = std::numeric_limits<double>::quiet_NaN();
    FallRiskAssessment rule;
    rule.compositeScore = 20.0;

    std::shared_ptr<FakeInferenceModel> model = modelWith("riskScore", {65.0f});
    std::shared_ptr<FakeModelProvider> provider = std::make_shared<FakeModelProvider>(true, model);
    const DualPath<FallRiskAssessment> dualPath(provider, ModelId::FallRiskPredictor);

    ResultPath path;
    const FallRiskAssessment result = dualPath.Run([&rule]() { return rule; },
                                                   [&input](IInferenceModel &m, const FallRiskAssessment &r) {
                                                       return InferencePaths::PredictFallRisk(m, input, r);
                                                   },
                                                   path);
    EXPECT_EQ(path, ResultPath::RuleBased);
    EXPECT_EQ(result.compositeScore, 20.0);
    EXPECT_EQ(model->predictCount, 0);
}

TEST(InferencePathsTest, NonFiniteOutputThrows)
{
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    std::shared_ptr<FakeInferenceModel> gait =
        modelWith("classProbability", {0.1f, nan, 0.7f, 0.05f, 0.0f, 0.05f, 0.05f, 0.0f});
    EXPECT_THROW(InferencePaths::PredictGaitPattern(*gait, GaitPatternInput(), GaitPatternResult()),
                 std::runtime_error);

    std::shared_ptr<FakeInferenceModel> posture = modelWith("compositeScore", {nan});
    PostureScore rule;
    rule.subScores["cva"] = 100.0;
    EXPECT_THROW(InferencePaths::PredictPostureScore(*posture, rule), std::runtime_error);

    std::shared_ptr<FakeInferenceModel> fallRisk = modelWith("riskScore", {inf});
    FallRiskInput input;
    input.walkingSpeedMPS = 1.0;
    EXPECT_THROW(InferencePaths::PredictFallRisk(*fallRisk, input, FallRiskAssessment()), std::runtime_error);
}

TEST(InferencePathsTest, NonFiniteProbabilitiesFallBackToTheRule)
{
    std::shared_ptr<FakeInferenceModel> model =
        modelWith("classProbability", {std::numeric_limits<float>::quiet_NaN(), 0.9f});
    std::shared_ptr<FakeModelProvider> provider = std::make_shared<FakeModelProvider>(true, model);
    const DualPath<GaitPatternResult> dualPath(provider, ModelId::GaitPatternClassifier);

    GaitPatternInput input;
    input.cadenceSPM = 110.0;
    GaitPatternResult rule;
    rule.primaryPattern = GaitPatternType::Normal;
    rule.confidence = 0.8;

    ResultPath path;
    const GaitPatternResult result = dualPath.Run([&rule]() { return rule; },
                                                  [&input](IInferenceModel &m, const GaitPatternResult &r) {
                                                      return InferencePaths::PredictGaitPattern(m, input, r);
                                                  },
                                                  path);
    EXPECT_EQ(path, ResultPath::RuleBased);
    EXPECT_EQ(result.primaryPattern, GaitPatternType::Normal);
    EXPECT_EQ(result.confidence, 0.8);
    EXPECT_EQ(model->predictCount, 1);
}
