/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>

#include "session/CrossedSyndromeDetector.hpp"
#include "session/PainRiskEngine.hpp"

namespace
{
    CrossedSyndromeInput neutralSpine()
    {
        CrossedSyndromeInput input;
        input.craniovertebralAngleDeg = 52.0;
        input.shoulderProtractionCm = 0.0;
        input.thoracicKyphosisDeg = 35.0;
        input.pelvicTiltDeg = 5.0;
        input.lumbarLordosisDeg = 45.0;
        return input;
    }

    PainRiskInput neutralPosture()
    {
        PainRiskInput input;
        input.craniovertebralAngleDeg = 52.0;
        input.sagittalVerticalAxisCm = 0.0;
        input.thoracicKyphosisDeg = 35.0;
        input.lumbarLordosisDeg = 45.0;
        input.shoulderAsymmetryCm = 0.0;
        input.pelvicObliquityDeg = 0.0;
        input.pelvicTiltDeg = 0.0;
        input.coronalSpineDeviationCm = 0.0;
        return input;
    }

    const PainRiskAlert &alertFor(const PainRiskAssessment &assessment, const PainRiskRegion region)
    {
        return assessment.alerts.at(static_cast<size_t>(region));
    }
}

TEST(CrossedSyndromeDetectorTest, NeutralSpineHasNoSyndrome)
{
    CrossedSyndromeDetector detector;
    const CrossedSyndromeResult result = detector.Detect(neutralSpine());
    EXPECT_EQ(result.upperCrossedScore, 0.0);
    EXPECT_EQ(result.lowerCrossedScore, 0.0);
    EXPECT_TRUE(result.detectedSyndromes.empty());
    EXPECT_TRUE(result.upperFactors.empty());
}

TEST(CrossedSyndromeDetectorTest, UpperCrossed)
{
    CrossedSyndromeInput input = neutralSpine();
    input.craniovertebralAngleDeg = 35.0;
    input.shoulderProtractionCm = 5.0;
    input.thoracicKyphosisDeg = 55.0;

    CrossedSyndromeDetector detector;
    const CrossedSyndromeResult result = detector.Detect(input);

    // 20 + 15 + 20
    EXPECT_NEAR(result.upperCrossedScore, 55.0, 1e-9);
    ASSERT_EQ(result.detectedSyndromes.size(), 1u);
    EXPECT_EQ(result.detectedSyndromes.front(), CrossedSyndromeType::UpperCrossed);
    ASSERT_EQ(result.upperFactors.size(), 3u);
    EXPECT_EQ(result.upperFactors.front(), "Forward head (CVA 35.0 deg)");
}

TEST(CrossedSyndromeDetectorTest, LowerCrossed)
{
    CrossedSyndromeInput input = neutralSpine();
    input.pelvicTiltDeg = 20.0;
    input.lumbarLordosisDeg = 70.0;
    input.hipFlexionRestDeg = 10.0;

    CrossedSyndromeDetector detector;
    const CrossedSyndromeResult result = detector.Detect(input);

    // 30 + 25 + 15
    EXPECT_NEAR(result.lowerCrossedScore, 70.0, 1e-9);
    ASSERT_EQ(result.detectedSyndromes.size(), 1u);
    EXPECT_EQ(result.detectedSyndromes.front(), CrossedSyndromeType::LowerCrossed);
    EXPECT_EQ(result.lowerFactors.size(), 3u);
}

TEST(CrossedSyndromeDetectorTest, DetectionStartsAtForty)
{
    CrossedSyndromeInput input = neutralSpine();
    input.craniovertebralAngleDeg = 30.0;  // 30
    input.shoulderProtractionCm = 4.0;     // 10

    CrossedSyndromeDetector detector;
    const CrossedSyndromeResult result = detector.Detect(input);
    EXPECT_NEAR(result.upperCrossedScore, 40.0, 1e-9);
    EXPECT_EQ(result.detectedSyndromes.size(), 1u);
}

TEST(PainRiskEngineTest, NeutralPostureHasNoRisk)
{
    PainRiskEngine engine;
    const PainRiskAssessment assessment = engine.Assess(neutralPosture());

    ASSERT_EQ(assessment.alerts.size(), 6u);
    for (const PainRiskAlert &alert : assessment.alerts)
    {
        EXPECT_EQ(alert.riskScore, 0.0);
        EXPECT_EQ(alert.severity, Severity::Normal);
        EXPECT_EQ(alert.recommendation, "Continue monitoring");
    }
    EXPECT_EQ(assessment.overallRiskScore, 0.0);
}

TEST(PainRiskEngineTest, ForwardHeadWithKyphosis)
{
    PainRiskInput input = neutralPosture();
    input.craniovertebralAngleDeg = 35.0;
    input.thoracicKyphosisDeg = 60.0;

    PainRiskEngine engine;
    const PainRiskAssessment assessment = engine.Assess(input);

    const PainRiskAlert &neck = alertFor(assessment, PainRiskRegion::Neck);
    EXPECT_EQ(neck.region, PainRiskRegion::Neck);
    EXPECT_NEAR(neck.riskScore, 50.0, 1e-9);
    EXPECT_EQ(neck.severity, Severity::Moderate);
    EXPECT_EQ(neck.recommendation, "Cervical retraction exercises; monitor workstation ergonomics");
    EXPECT_EQ(neck.factors.size(), 2u);

    const PainRiskAlert &shoulder = alertFor(assessment, PainRiskRegion::Shoulder);
    EXPECT_NEAR(shoulder.riskScore, 30.0, 1e-9);
    EXPECT_EQ(shoulder.severity, Severity::Mild);
    EXPECT_EQ(shoulder.recommendation, "Continue monitoring");

    EXPECT_NEAR(alertFor(assessment, PainRiskRegion::UpperBack).riskScore, 30.0, 1e-9);
    // mean of the three highest regions
    EXPECT_NEAR(assessment.overallRiskScore, (50.0 + 30.0 + 30.0) / 3.0, 1e-9);
}

TEST(PainRiskEngineTest, HypolordosisLoadsTheLowerBack)
{
    PainRiskInput input = neutralPosture();
    input.lumbarLordosisDeg = 15.0;

    PainRiskEngine engine;
    const PainRiskAlert &lowerBack = alertFor(engine.Assess(input), PainRiskRegion::LowerBack);
    EXPECT_NEAR(lowerBack.riskScore, 30.0, 1e-9);
    ASSERT_EQ(lowerBack.factors.size(), 1u);
    EXPECT_EQ(lowerBack.factors.front(), "Hypolordosis (15 deg)");
}

TEST(PainRiskEngineTest, RegionScoreIsCapped)
{
    PainRiskInput input = neutralPosture();
    input.lumbarLordosisDeg = 90.0;
    input.sagittalVerticalAxisCm = 20.0;
    input.pelvicTiltDeg = 30.0;
    input.coronalSpineDeviationCm = 10.0;

    PainRiskEngine engine;
    const PainRiskAlert &lowerBack = alertFor(engine.Assess(input), PainRiskRegion::LowerBack);
    EXPECT_NEAR(lowerBack.riskScore, 100.0, 1e-9);
    EXPECT_EQ(lowerBack.severity, Severity::Severe);
    EXPECT_EQ(lowerBack.recommendation, "Core stabilization; lumbar-pelvic alignment exercises");
}

TEST(PainRiskEngineTest, GaitAsymmetryAffectsHipAndKnee)
{
    PainRiskInput input = neutralPosture();
    input.gaitAsymmetryPercent = 25.0;
    input.kneeFlexionStandingDeg = 15.0;

    PainRiskEngine engine;
    const PainRiskAssessment assessment = engine.Assess(input);
    EXPECT_NEAR(alertFor(assessment, PainRiskRegion::Hip).riskScore, 20.0, 1e-9);
    EXPECT_NEAR(alertFor(assessment, PainRiskRegion::Knee).riskScore, 40.0, 1e-9);
}

TEST(PainRiskEngineTest, SeverityFromScore)
{
    EXPECT_EQ(PainRiskEngine::SeverityFromScore(24.9), Severity::Normal);
    EXPECT_EQ(PainRiskEngine::SeverityFromScore(25.0), Severity::Mild);
    EXPECT_EQ(PainRiskEngine::SeverityFromScore(50.0), Severity::Moderate);
    EXPECT_EQ(PainRiskEngine::SeverityFromScore(75.0), Severity::Severe);
}

TEST(CrossedSyndromeDetectorTest, ScoresStayInRangeForExtremeInput)
{
    CrossedSyndromeDetector detector;
    for (const double value : {-1.0e6, -90.0, -1.0, 0.0, 60.0, 1.0e3, 1.0e9})
    {
        CrossedSyndromeInput input;
        input.craniovertebralAngleDeg = value;
        input.shoulderProtractionCm = value;
        input.thoracicKyphosisDeg = value;
        input.cervicalLordosisDeg = value;
        input.pelvicTiltDeg = value;
        input.lumbarLordosisDeg = value;
        input.hipFlexionRestDeg = value;

        const CrossedSyndromeResult result = detector.Detect(input);
        EXPECT_GE(result.upperCrossedScore, 0.0) << value;
        EXPECT_LE(result.upperCrossedScore, 100.0) << value;
        EXPECT_GE(result.lowerCrossedScore, 0.0) << value;
        EXPECT_LE(result.lowerCrossedScore, 100.0) << value;
    }
}

TEST(PainRiskEngineTest, ScoresStayInRangeForExtremeInput)
{
    PainRiskEngine engine;
    for (const double value : {-1.0e6, -90.0, -1.0, 0.0, 60.0, 1.0e3, 1.0e9})
    {
        PainRiskInput input;
        input.craniovertebralAngleDeg = value;
        input.sagittalVerticalAxisCm = value;
        input.thoracicKyphosisDeg = value;
        input.lumbarLordosisDeg = value;
        input.shoulderAsymmetryCm = value;
        input.pelvicObliquityDeg = value;
        input.pelvicTiltDeg = value;
        input.coronalSpineDeviationCm = value;
        input.kneeFlexionStandingDeg = value;
        input.gaitAsymmetryPercent = value;

        const PainRiskAssessment assessment = engine.Assess(input);
        ASSERT_EQ(assessment.alerts.size(), 6u);
        for (const PainRiskAlert &alert : assessment.alerts)
        {
            EXPECT_GE(alert.riskScore, 0.0) << value;
            EXPECT_LE(alert.riskScore, 100.0) << value;
        }
        EXPECT_GE(assessment.overallRiskScore, 0.0) << value;
        EXPECT_LE(assessment.overallRiskScore, 100.0) << value;
    }
}
