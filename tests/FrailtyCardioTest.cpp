/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>

#include "session/CardioEstimator.hpp"
#include "session/FrailtyScreener.hpp"

TEST(FrailtyScreenerTest, NoDataIsRobustWithPendingCriteria)
{
    FrailtyScreener screener;
    const FrailtyResult result = screener.Screen(FrailtyInput());

    EXPECT_EQ(result.friedScore, 0);
    EXPECT_EQ(result.classification, FrailtyClass::Robust);
    ASSERT_EQ(result.criteria.size(), 5u);
    EXPECT_EQ(result.criteria[0].source, CriterionSource::Unavailable);
    EXPECT_EQ(result.criteria[2].source, CriterionSource::SelfReport);
    EXPECT_EQ(result.criteria[3].name, "Weakness (Grip Strength)");
    EXPECT_EQ(result.interpretation,
              "No frailty indicators detected from available data. 5 criteria require clinical assessment.");
}

TEST(FrailtyScreenerTest, SlowAndInactiveIsPreFrail)
{
    FrailtyInput input;
    input.walkingSpeedMPS = 0.6;
    input.heightM = 1.65;
    input.sex = BiologicalSex::Male;
    input.dailyStepCount = 2000.0;

    FrailtyScreener screener;
    const FrailtyResult result = screener.Screen(input);

    EXPECT_EQ(result.friedScore, 2);
    EXPECT_EQ(result.classification, FrailtyClass::PreFrail);
    EXPECT_TRUE(result.criteria[0].isMet);
    EXPECT_EQ(result.criteria[0].source, CriterionSource::Measured);
    EXPECT_DOUBLE_EQ(*result.criteria[0].threshold, 0.65);
    EXPECT_EQ(result.criteria[1].source, CriterionSource::Proxy);
    EXPECT_EQ(result.interpretation,
              "Pre-frailty indicators present (2 of 5 criteria). Consider comprehensive geriatric assessment.");
}

TEST(FrailtyScreenerTest, ThreeCriteriaAreFrail)
{
    FrailtyInput input;
    input.walkingSpeedMPS = 0.5;
    input.dailyStepCount = 1500.0;
    input.strideTimeCVPercent = 8.0;
    input.postureVariabilitySD = 7.0;
    input.weightLossSelfReport = true;

    FrailtyScreener screener;
    const FrailtyResult result = screener.Screen(input);

    EXPECT_EQ(result.friedScore, 4);
    EXPECT_EQ(result.classification, FrailtyClass::Frail);
    EXPECT_EQ(result.criteria[2].source, CriterionSource::Proxy);
    EXPECT_FALSE(result.criteria[3].isMet);
}

TEST(FrailtyScreenerTest, SlownessCutoff)
{
    EXPECT_DOUBLE_EQ(FrailtyScreener::SlownessCutoff(1.80, BiologicalSex::Male), 0.76);
    EXPECT_DOUBLE_EQ(FrailtyScreener::SlownessCutoff(1.73, BiologicalSex::Male), 0.65);
    EXPECT_DOUBLE_EQ(FrailtyScreener::SlownessCutoff(1.59, BiologicalSex::Female), 0.65);
    EXPECT_DOUBLE_EQ(FrailtyScreener::SlownessCutoff(1.65, BiologicalSex::Female), 0.76);
    EXPECT_DOUBLE_EQ(FrailtyScreener::SlownessCutoff(std::nullopt, BiologicalSex::NotSet), 0.65);
}

TEST(CardioEstimatorTest, WalkingEquation)
{
    CardioEstimator estimator;
    const CardioEstimate estimate = estimator.Estimate(1.2, 120.0, 1.2);

    EXPECT_NEAR(estimate.estimatedMET, 10.7 / 3.5, 1e-9);
    EXPECT_EQ(estimate.intensity, ActivityIntensity::Moderate);
    EXPECT_NEAR(estimate.walkRatio, 0.005, 1e-12);
    EXPECT_NEAR(estimate.costOfTransportProxy, 10.7 / 3.5 / 1.2, 1e-9);
}

TEST(CardioEstimatorTest, StandingStill)
{
    CardioEstimator estimator;
    const CardioEstimate estimate = estimator.Estimate(0.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(estimate.estimatedMET, 1.0);
    EXPECT_EQ(estimate.intensity, ActivityIntensity::Sedentary);
    EXPECT_EQ(estimate.walkRatio, 0.0);
    EXPECT_EQ(estimate.costOfTransportProxy, 0.0);
}

TEST(CardioEstimatorTest, SixMinuteWalkPrediction)
{
    CardioEstimator estimator;
    const SixMinuteWalkResult male = estimator.EvaluateSixMinuteWalk(450.0, 70, 1.75, 80.0, BiologicalSex::Male);
    ASSERT_TRUE(male.predictedDistanceM.has_value());
    EXPECT_NEAR(*male.predictedDistanceM, 7.57 * 175.0 - 5.02 * 70 - 1.76 * 80.0 - 309.0, 1e-9);
    ASSERT_TRUE(male.percentPredicted.has_value());
    EXPECT_NEAR(*male.percentPredicted, 450.0 / *male.predictedDistanceM * 100.0, 1e-9);
    EXPECT_EQ(male.classification, "Mild limitation");

    const SixMinuteWalkResult female = estimator.EvaluateSixMinuteWalk(550.0, 60, 1.60, 60.0, BiologicalSex::Female);
    EXPECT_NEAR(*female.predictedDistanceM, 2.11 * 160.0 - 2.29 * 60.0 - 5.78 * 60 + 667.0, 1e-9);
    EXPECT_EQ(female.classification, "Normal functional capacity");
}

TEST(CardioEstimatorTest, SixMinuteWalkWithoutProfile)
{
    CardioEstimator estimator;
    const SixMinuteWalkResult result =
        estimator.EvaluateSixMinuteWalk(250.0, 70, std::nullopt, 80.0, BiologicalSex::Male);
    EXPECT_FALSE(result.predictedDistanceM.has_value());
    EXPECT_FALSE(result.percentPredicted.has_value());
    EXPECT_EQ(result.classification, "Severely limited functional capacity");

    EXPECT_EQ(estimator.EvaluateSixMinuteWalk(350.0, std::nullopt, std::nullopt, std::nullopt, BiologicalSex::NotSet)
                  .classification,
              "Moderate functional limitation");
}

TEST(CardioEstimatorTest, TimedUpAndGo)
{
    CardioEstimator estimator;
    EXPECT_EQ(estimator.EvaluateTug(8.0).fallRisk, FallRiskLevel::Low);
    EXPECT_EQ(estimator.EvaluateTug(8.0).mobilityLevel, "Freely mobile");
    EXPECT_EQ(estimator.EvaluateTug(12.0).fallRisk, FallRiskLevel::Moderate);
    EXPECT_EQ(estimator.EvaluateTug(12.0).mobilityLevel, "Mostly independent");
    EXPECT_EQ(estimator.EvaluateTug(15.0).fallRisk, FallRiskLevel::High);
    EXPECT_EQ(estimator.EvaluateTug(25.0).mobilityLevel, "Variable mobility");
}
