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
#include "analyzers/ErgonomicScorer.hpp"

TEST(ErgonomicScorerTest, UprightStanceIsLowRisk)
{
    ErgonomicScorer scorer;
    const std::optional<RebaResult> reba = scorer.Compute(TestSkeleton::StandingFrame(0.0));
    ASSERT_TRUE(reba.has_value());
    const RebaResult &result = *reba;

    EXPECT_EQ(result.trunkScore, 1);
    EXPECT_EQ(result.legScore, 1);
    EXPECT_EQ(result.upperArmScore, 1);
    EXPECT_EQ(result.wristScore, 1);
    // straight elbows are outside the 60-100 deg band
    EXPECT_EQ(result.lowerArmScore, 2);
    EXPECT_EQ(result.score, 2);
    EXPECT_EQ(result.riskLevel, RebaRiskLevel::Low);
    EXPECT_EQ(result.action, "May need change");
}

TEST(ErgonomicScorerTest, OccludedBodyGivesNoScore)
{
    ErgonomicScorer scorer;
    EXPECT_FALSE(scorer.Compute(JointFrame()).has_value());

    for (const JointName joint : {JointName::Hips, JointName::Spine7, JointName::Head, JointName::LeftFoot,
                                  JointName::RightLeg})
    {
        JointFrame frame = TestSkeleton::StandingFrame(0.0);
        frame.joints.erase(joint);
        EXPECT_FALSE(scorer.Compute(frame).has_value()) << JointNameUtil::ToString(joint);
    }
}

TEST(ErgonomicScorerTest, OneVisibleArmIsEnough)
{
    JointFrame frame = TestSkeleton::StandingFrame(0.0);
    frame.joints.erase(JointName::LeftForearm);
    frame.joints.erase(JointName::LeftHand);

    ErgonomicScorer scorer;
    const std::optional<RebaResult> result = scorer.Compute(frame);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->upperArmScore, 1);
    EXPECT_EQ(result->lowerArmScore, 2);
    EXPECT_EQ(result->score, 2);

    frame.joints.erase(JointName::RightHand);
    EXPECT_FALSE(scorer.Compute(frame).has_value());
}

TEST(ErgonomicScorerTest, BentOverOnOneLeg)
{
    JointMap joints = TestSkeleton::Standing();
    joints[JointName::Spine7] = joints[JointName::Hips] + cv::Point3d(0.0, 0.51, 0.68);
    joints[JointName::Head] = joints[JointName::Spine7] + cv::Point3d(0.0, 0.0, 0.2);
    joints[JointName::RightFoot].y = 0.3;

    ErgonomicScorer scorer;
    const std::optional<RebaResult> result = scorer.Compute(JointFrame(0.0, joints));
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->trunkScore, 3);
    EXPECT_EQ(result->neckScore, 2);
    EXPECT_EQ(result->legScore, 2);
    // table A [3][2][2] = 5, table B 1, table C [5][1] = 4
    EXPECT_EQ(result->score, 5);
    EXPECT_EQ(result->riskLevel, RebaRiskLevel::Medium);
}

TEST(ErgonomicScorerTest, RaisedArm)
{
    JointMap joints = TestSkeleton::Standing();
    const cv::Point3d shoulder = joints[JointName::LeftShoulder];
    joints[JointName::LeftArm] = shoulder + cv::Point3d(0.0, 0.0, 0.05);

    ErgonomicScorer scorer;
    const std::optional<RebaResult> result = scorer.Compute(JointFrame(0.0, joints));
    ASSERT_TRUE(result.has_value());
    // 90 deg flexion
    EXPECT_EQ(result->upperArmScore, 3);
}

TEST(ErgonomicScorerTest, RiskLevelsAndActions)
{
    EXPECT_EQ(ErgonomicScorer::RiskLevel(1), RebaRiskLevel::Negligible);
    EXPECT_EQ(ErgonomicScorer::RiskLevel(3), RebaRiskLevel::Low);
    EXPECT_EQ(ErgonomicScorer::RiskLevel(7), RebaRiskLevel::Medium);
    EXPECT_EQ(ErgonomicScorer::RiskLevel(10), RebaRiskLevel::High);
    EXPECT_EQ(ErgonomicScorer::RiskLevel(11), RebaRiskLevel::VeryHigh);

    EXPECT_EQ(ErgonomicScorer::Action(RebaRiskLevel::Negligible), "No action required");
    EXPECT_EQ(ErgonomicScorer::Action(RebaRiskLevel::VeryHigh), "Immediate investigation and changes required");
}
