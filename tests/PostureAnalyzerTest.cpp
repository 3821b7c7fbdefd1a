/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>

#include "TestHelpers.hpp"
#include "analyzers/PostureAnalyzer.hpp"

TEST(PostureAnalyzerTest, MeasuresSpineGeometry)
{
    PostureAnalyzer analyzer;
    const std::optional<PostureMetrics> metrics = analyzer.Measure(TestSkeleton::StandingFrame(0.0));
    ASSERT_TRUE(metrics.has_value());

    EXPECT_NEAR(metrics->craniovertebralAngleDeg, 52.0, 1e-6);
    ASSERT_TRUE(metrics->thoracicKyphosisDeg.has_value());
    ASSERT_TRUE(metrics->lumbarLordosisDeg.has_value());
    EXPECT_NEAR(*metrics->thoracicKyphosisDeg, 35.0, 1e-6);
    EXPECT_NEAR(*metrics->lumbarLordosisDeg, 45.0, 1e-6);
    EXPECT_NEAR(metrics->sagittalVerticalAxisCm, -1.41, 0.01);
    EXPECT_NEAR(metrics->trunkLeanDeg, -1.56, 0.01);
    EXPECT_NEAR(metrics->lateralLeanDeg, 0.0, 1e-9);
    EXPECT_NEAR(metrics->shoulderAsymmetryCm.value(), 0.0, 1e-9);
    EXPECT_NEAR(metrics->shoulderProtractionCm.value(), 0.0, 1e-9);
    EXPECT_NEAR(metrics->pelvicObliquityDeg.value(), 0.0, 1e-9);
    EXPECT_NEAR(metrics->pelvicTiltDeg.value(), 0.0, 1e-9);
    EXPECT_NEAR(metrics->coronalSpineDeviationCm.value(), 0.0, 1e-9);
}

TEST(PostureAnalyzerTest, AsymmetryMeasures)
{
    SpineShape shape;
    shape.pelvicObliquityDeg = 4.0;
    shape.shoulderProtractionCm = 3.0;

    JointMap joints = TestSkeleton::Standing(shape);
    joints[JointName::LeftShoulder].y += 0.02;

    PostureAnalyzer analyzer;
    const std::optional<PostureMetrics> metrics = analyzer.Measure(JointFrame(0.0, joints));
    ASSERT_TRUE(metrics.has_value());
    EXPECT_NEAR(metrics->pelvicObliquityDeg.value(), 4.0, 1e-6);
    EXPECT_NEAR(metrics->shoulderAsymmetryCm.value(), 2.0, 1e-6);
    EXPECT_GT(metrics->shoulderTiltDeg.value(), 0.0);
    EXPECT_NEAR(metrics->shoulderProtractionCm.value(), 3.0, 1e-6);
}

TEST(PostureAnalyzerTest, OccludedSpineLeavesItsMeasuresAbsent)
{
    JointFrame frame = TestSkeleton::StandingFrame(0.0);
    frame.joints.erase(JointName::Spine2);

    PostureAnalyzer analyzer;
    const std::optional<PostureAssessment> assessment = analyzer.Analyze(frame);
    ASSERT_TRUE(assessment.has_value());
    EXPECT_FALSE(assessment->metrics.lumbarLordosisDeg.has_value());
    EXPECT_TRUE(assessment->metrics.thoracicKyphosisDeg.has_value());

    // the missing lordosis neither scores nor classifies
    EXPECT_EQ(assessment->score.subScores.size(), 8u);
    EXPECT_EQ(assessment->score.subScores.count("lordosis"), 0u);
    EXPECT_GT(assessment->score.compositeScore, 90.0);
    EXPECT_EQ(assessment->posturalType, PosturalType::Ideal);
    EXPECT_EQ(assessment->severities.count("lordosis"), 0u);
    EXPECT_EQ(assessment->nyprScore, 40);
}

TEST(PostureAnalyzerTest, FillMissingKeepsMeasuredValues)
{
    PostureMetrics previous;
    previous.lumbarLordosisDeg = 45.0;
    previous.thoracicKyphosisDeg = 35.0;

    PostureMetrics current;
    current.thoracicKyphosisDeg = 50.0;
    current.FillMissing(previous);
    EXPECT_EQ(current.lumbarLordosisDeg, std::optional<double>(45.0));
    EXPECT_EQ(current.thoracicKyphosisDeg, std::optional<double>(50.0));
    EXPECT_FALSE(current.coronalSpineDeviationCm.has_value());
}

TEST(PostureAnalyzerTest, RequiresRootNeckAndHead)
{
    PostureAnalyzer analyzer;
    for (const JointName joint : {JointName::Root, JointName::Neck1, JointName::Head})
    {
        JointFrame frame = TestSkeleton::StandingFrame(0.0);
        frame.joints.erase(joint);
        EXPECT_FALSE(analyzer.Measure(frame).has_value()) << JointNameUtil::ToString(joint);
        EXPECT_FALSE(analyzer.Analyze(frame).has_value());
    }
}

TEST(PostureAnalyzerTest, HeadBehindNeckCountsAsUpright)
{
    JointMap joints = TestSkeleton::Standing();
    joints[JointName::Head] = joints[JointName::Neck1] + cv::Point3d(0.0, 0.05, -0.10);

    PostureAnalyzer analyzer;
    const std::optional<PostureMetrics> metrics = analyzer.Measure(JointFrame(0.0, joints));
    ASSERT_TRUE(metrics.has_value());
    EXPECT_NEAR(metrics->craniovertebralAngleDeg, 90.0, 1e-9);
}

TEST(PostureAnalyzerTest, UprightStanceScoresHigh)
{
    PostureAnalyzer analyzer;
    const std::optional<PostureAssessment> assessment = analyzer.Analyze(TestSkeleton::StandingFrame(0.0));
    ASSERT_TRUE(assessment.has_value());

    EXPECT_GT(assessment->score.compositeScore, 90.0);
    EXPECT_EQ(assessment->score.subScores.size(), 9u);
    EXPECT_EQ(assessment->posturalType, PosturalType::Ideal);
    EXPECT_EQ(assessment->nyprScore, 45);
    for (const auto &item : assessment->severities)
    {
        EXPECT_EQ(item.second, Severity::Normal) << item.first;
    }
}

TEST(PostureAnalyzerTest, SlouchedStanceIsKyphoticLordotic)
{
    PostureAnalyzer analyzer;
    const std::optional<PostureAssessment> assessment =
        analyzer.Analyze(TestSkeleton::StandingFrame(0.0, TestSkeleton::Slouched()));
    ASSERT_TRUE(assessment.has_value());

    EXPECT_GT(assessment->metrics.sagittalVerticalAxisCm, 5.0);
    EXPECT_EQ(assessment->posturalType, PosturalType::KyphosisLordosis);
    EXPECT_LT(assessment->score.compositeScore, 50.0);
    EXPECT_EQ(assessment->severities.at("cva"), Severity::Severe);
    EXPECT_LT(assessment->nyprScore, 45);
}

TEST(PostureAnalyzerTest, CompositeScoreOfKyphoticLordoticProfile)
{
    PostureScoreInput input;
    input.cvaDeg = 26.0;
    input.svaCm = 11.0;
    input.trunkLeanDeg = 0.0;
    input.lateralLeanDeg = 0.0;
    input.shoulderAsymmetryCm = 0.0;
    input.kyphosisDeg = 72.0;
    input.pelvicObliquityDeg = 0.0;
    input.lordosisDeg = 82.0;
    input.coronalDeviationCm = 0.0;

    const PostureScore score = PostureAnalyzer::ComputeScore(input);
    EXPECT_NEAR(score.compositeScore, 39.0, 1e-9);
    EXPECT_EQ(score.subScores.at("cva"), 0.0);
    EXPECT_EQ(score.subScores.at("sva"), 0.0);
    EXPECT_EQ(score.subScores.at("kyphosis"), 0.0);
    EXPECT_EQ(score.subScores.at("lordosis"), 0.0);

    EXPECT_EQ(PostureAnalyzer::ClassifyKendall(26.0, 11.0, 72.0, 82.0, 0.0), PosturalType::KyphosisLordosis);
    EXPECT_EQ(PostureAnalyzer::ClassifyKendall(26.0, 11.0, 72.0, std::nullopt, 0.0), PosturalType::Ideal);
    EXPECT_EQ(PostureAnalyzer::ClassifyKendall(52.0, 0.0, std::nullopt, 20.0, std::nullopt), PosturalType::Ideal);
}

TEST(PostureAnalyzerTest, AbsentFactorsAreLeftOutOfTheMean)
{
    PostureScoreInput input;
    input.cvaDeg = 52.0;
    input.svaCm = 4.0;

    const PostureScore score = PostureAnalyzer::ComputeScore(input);
    EXPECT_EQ(score.subScores.size(), 2u);
    // (0.22 * 100 + 0.22 * 50) / 0.44
    EXPECT_NEAR(score.compositeScore, 75.0, 1e-9);

    EXPECT_EQ(PostureAnalyzer::ComputeScore(PostureScoreInput()).compositeScore, 0.0);
}

TEST(PostureAnalyzerTest, KendallTypes)
{
    EXPECT_EQ(PostureAnalyzer::ClassifyKendall(52.0, 0.0, 35.0, 45.0, 0.0), PosturalType::Ideal);
    EXPECT_EQ(PostureAnalyzer::ClassifyKendall(52.0, 0.0, 30.0, 25.0, 0.0), PosturalType::FlatBack);
    EXPECT_EQ(PostureAnalyzer::ClassifyKendall(40.0, 2.0, 50.0, 45.0, -8.0), PosturalType::SwayBack);
    // a forward trunk rules out sway-back
    EXPECT_EQ(PostureAnalyzer::ClassifyKendall(40.0, 7.0, 50.0, 45.0, -8.0), PosturalType::Ideal);
}

TEST(PostureAnalyzerTest, JointSeveritiesTakeTheWorseFactor)
{
    std::map<std::string, Severity> severities = {{"cva", Severity::Mild}, {"sva", Severity::Severe}};
    const std::map<JointName, Severity> joints = PostureAnalyzer::JointSeverities(severities);

    EXPECT_EQ(joints.at(JointName::Head), Severity::Mild);
    EXPECT_EQ(joints.at(JointName::Neck1), Severity::Severe);
    EXPECT_EQ(joints.at(JointName::Root), Severity::Severe);
    EXPECT_EQ(joints.count(JointName::Spine5), 0u);
}

TEST(PostureAnalyzerTest, ScoreStaysInRangeForExtremeInput)
{
    for (const double value : {-1.0e6, -180.0, -1.0, 0.0, 52.0, 1.0e3, 1.0e9})
    {
        PostureScoreInput input;
        input.cvaDeg = value;
        input.svaCm = value;
        input.trunkLeanDeg = value;
        input.lateralLeanDeg = value;
        input.shoulderAsymmetryCm = value;
        input.kyphosisDeg = value;
        input.pelvicObliquityDeg = value;
        input.lordosisDeg = value;
        input.coronalDeviationCm = value;

        const PostureScore score = PostureAnalyzer::ComputeScore(input);
        EXPECT_GE(score.compositeScore, 0.0) << value;
        EXPECT_LE(score.compositeScore, 100.0) << value;
        for (const auto &item : score.subScores)
        {
            EXPECT_GE(item.second, 0.0) << item.first << " " << value;
            EXPECT_LE(item.second, 100.0) << item.first << " " << value;
        }
    }
}
