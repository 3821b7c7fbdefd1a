/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "ErgonomicScorer.hpp"

#include <algorithm>
#include <cmath>

#include "MathUtil.hpp"

namespace
{
    // [trunk 1-5][neck 1-3][legs 1-4]
    const int TABLE_A[5][3][4] = {
        {{1, 2, 3, 4}, {1, 2, 3, 4}, {3, 3, 5, 6}},
        {{2, 3, 4, 5}, {3, 4, 5, 6}, {4, 5, 6, 7}},
        {{2, 4, 5, 6}, {4, 5, 6, 7}, {5, 6, 7, 8}},
        {{3, 5, 6, 7}, {5, 6, 7, 8}, {6, 7, 8, 9}},
        {{4, 6, 7, 8}, {6, 7, 8, 9}, {7, 8, 9, 9}},
    };

    // [upper arm 1-6][lower arm 1-2][wrist 1-3]
    const int TABLE_B[6][2][3] = {
        {{1, 2, 2}, {1, 2, 3}},
        {{1, 2, 3}, {2, 3, 4}},
        {{3, 4, 5}, {4, 5, 5}},
        {{4, 5, 5}, {5, 6, 7}},
        {{6, 7, 8}, {7, 8, 8}},
        {{7, 8, 8}, {8, 9, 9}},
    };

    // [score A 1-12][score B 1-12]
    const int TABLE_C[12][12] = {
        {1, 1, 1, 2, 3, 3, 4, 5, 6, 7, 7, 7},
        {1, 2, 2, 3, 4, 4, 5, 6, 6, 7, 7, 8},
        {2, 3, 3, 3, 4, 5, 6, 7, 7, 8, 8, 8},
        {3, 4, 4, 4, 5, 6, 7, 8, 8, 9, 9, 9},
        {4, 4, 4, 5, 6, 7, 8, 8, 9, 9, 9, 10},
        {6, 6, 6, 7, 8, 8, 9, 9, 10, 10, 10, 10},
        {7, 7, 7, 8, 9, 9, 9, 10, 10, 11, 11, 11},
        {8, 8, 8, 9, 10, 10, 10, 10, 10, 11, 11, 11},
        {9, 9, 9, 10, 10, 10, 11, 11, 11, 12, 12, 12},
        {10, 10, 10, 11, 11, 11, 11, 12, 12, 12, 12, 12},
        {11, 11, 11, 11, 12, 12, 12, 12, 12, 12, 12, 12},
        {12, 12, 12, 12, 12, 12, 12, 12, 12, 12, 12, 12},
    };

    const int ACTIVITY_SCORE = 1;

    int index(const int score, const int max) { return MathUtil::Clamp(score, 1, max) - 1; }

    /// @brief Worse score of the two sides, absent when neither side was scored
    std::optional<int> worseSide(const std::optional<int> &left, const std::optional<int> &right)
    {
        if (left && right) return std::max(*left, *right);
        return left ? left : right;
    }
}

std::optional<int> ErgonomicScorer::scoreTrunk(const JointFrame &frame)
{
    const cv::Point3d *hips = frame.Find(JointName::Hips);
    const cv::Point3d *spine7 = frame.Find(JointName::Spine7);
    if (hips == nullptr || spine7 == nullptr) return std::nullopt;

    const cv::Point3d trunk = *spine7 - *hips;
    const double angle = std::abs(MathUtil::SagittalAngleFromVerticalDeg(trunk));

    int score = 4;
    if (angle < 5.0)
        score = 1;
    else if (angle <= 20.0)
        score = 2;
    else if (angle <= 60.0)
        score = 3;

    // side bending
    if (std::abs(MathUtil::FrontalAngleFromVerticalDeg(trunk)) > 10.0) score++;
    return std::min(5, score);
}

std::optional<int> ErgonomicScorer::scoreNeck(const JointFrame &frame)
{
    const cv::Point3d *spine7 = frame.Find(JointName::Spine7);
    const cv::Point3d *head = frame.Find(JointName::Head);
    if (spine7 == nullptr || head == nullptr) return std::nullopt;

    const cv::Point3d neck = *head - *spine7;
    const double angle = MathUtil::SagittalAngleFromVerticalDeg(neck);
    int score = (angle >= 0.0 && angle <= 20.0) ? 1 : 2;
    if (std::abs(MathUtil::FrontalAngleFromVerticalDeg(neck)) > 10.0) score++;
    return std::min(3, score);
}

std::optional<int> ErgonomicScorer::scoreLegs(const JointFrame &frame)
{
    const cv::Point3d *leftHip = frame.Find(JointName::LeftUpLeg);
    const cv::Point3d *rightHip = frame.Find(JointName::RightUpLeg);
    const cv::Point3d *leftKnee = frame.Find(JointName::LeftLeg);
    const cv::Point3d *rightKnee = frame.Find(JointName::RightLeg);
    const cv::Point3d *leftAnkle = frame.Find(JointName::LeftFoot);
    const cv::Point3d *rightAnkle = frame.Find(JointName::RightFoot);
    if (leftHip == nullptr || rightHip == nullptr || leftKnee == nullptr || rightKnee == nullptr ||
        leftAnkle == nullptr || rightAnkle == nullptr)
    {
        return std::nullopt;
    }

    // unilateral support when one foot is lifted
    int score = std::abs(leftAnkle->y - rightAnkle->y) > 0.1 ? 2 : 1;

    const double leftFlexion = 180.0 - MathUtil::ThreePointAngleDeg(*leftHip, *leftKnee, *leftAnkle);
    const double rightFlexion = 180.0 - MathUtil::ThreePointAngleDeg(*rightHip, *rightKnee, *rightAnkle);
    const double kneeFlexion = std::max(leftFlexion, rightFlexion);
    if (kneeFlexion > 60.0)
        score += 2;
    else if (kneeFlexion > 30.0)
        score += 1;
    return std::min(4, score);
}

std::optional<int> ErgonomicScorer::scoreUpperArm(const JointFrame &frame, const JointName shoulder, const JointName elbow)
{
    const cv::Point3d *shoulderJoint = frame.Find(shoulder);
    const cv::Point3d *elbowJoint = frame.Find(elbow);
    if (shoulderJoint == nullptr || elbowJoint == nullptr) return std::nullopt;

    // measured from the hanging position
    const cv::Point3d hanging = *elbowJoint - *shoulderJoint;
    const cv::Point3d arm(hanging.x, -hanging.y, hanging.z);
    const double angle = std::abs(MathUtil::SagittalAngleFromVerticalDeg(arm));

    int score = 4;
    if (angle <= 20.0)
        score = 1;
    else if (angle <= 45.0)
        score = 2;
    else if (angle <= 90.0)
        score = 3;

    // raised shoulder
    const cv::Point3d *spine7 = frame.Find(JointName::Spine7);
    if (spine7 != nullptr && shoulderJoint->y - spine7->y > 0.05) score++;

    // abduction
    if (std::abs(MathUtil::FrontalAngleFromVerticalDeg(arm)) > 30.0) score++;
    return std::min(6, score);
}

std::optional<int> ErgonomicScorer::scoreLowerArm(const JointFrame &frame, const JointName upper, const JointName elbow,
                                   const JointName wrist)
{
    const cv::Point3d *upperJoint = frame.Find(upper);
    const cv::Point3d *elbowJoint = frame.Find(elbow);
    const cv::Point3d *wristJoint = frame.Find(wrist);
    if (upperJoint == nullptr || elbowJoint == nullptr || wristJoint == nullptr) return std::nullopt;

    const double flexion = 180.0 - MathUtil::ThreePointAngleDeg(*upperJoint, *elbowJoint, *wristJoint);
    return (flexion >= 60.0 && flexion <= 100.0) ? 1 : 2;
}

/// @brief The tracker has no wrist articulation, the forearm to hand deviation is used instead
std::optional<int> ErgonomicScorer::scoreWrist(const JointFrame &frame, const JointName forearm, const JointName hand)
{
    const cv::Point3d *forearmJoint = frame.Find(forearm);
    const cv::Point3d *handJoint = frame.Find(hand);
    if (forearmJoint == nullptr || handJoint == nullptr) return std::nullopt;

    const cv::Point3d hand = *handJoint - *forearmJoint;
    const double deviation = std::abs(MathUtil::FrontalAngleFromVerticalDeg(cv::Point3d(hand.x, -hand.y, hand.z)));
    return deviation < 15.0 ? 1 : 2;
}

int ErgonomicScorer::lookupTableA(const int trunk, const int neck, const int legs)
{
    return TABLE_A[index(trunk, 5)][index(neck, 3)][index(legs, 4)];
}

int ErgonomicScorer::lookupTableB(const int upperArm, const int lowerArm, const int wrist)
{
    return TABLE_B[index(upperArm, 6)][index(lowerArm, 2)][index(wrist, 3)];
}

int ErgonomicScorer::lookupTableC(const int scoreA, const int scoreB)
{
    return TABLE_C[index(scoreA, 12)][index(scoreB, 12)];
}

std::optional<RebaResult> ErgonomicScorer::Compute(const JointFrame &frame) const
{
    const std::optional<int> trunk = scoreTrunk(frame);
    const std::optional<int> neck = scoreNeck(frame);
    const std::optional<int> legs = scoreLegs(frame);
    const std::optional<int> upperArm = worseSide(scoreUpperArm(frame, JointName::LeftShoulder, JointName::LeftArm),
                                                  scoreUpperArm(frame, JointName::RightShoulder, JointName::RightArm));
    const std::optional<int> lowerArm =
        worseSide(scoreLowerArm(frame, JointName::LeftArm, JointName::LeftForearm, JointName::LeftHand),
                  scoreLowerArm(frame, JointName::RightArm, JointName::RightForearm, JointName::RightHand));
    const std::optional<int> wrist = worseSide(scoreWrist(frame, JointName::LeftForearm, JointName::LeftHand),
                                               scoreWrist(frame, JointName::RightForearm, JointName::RightHand));
    if (!trunk || !neck || !legs || !upperArm || !lowerArm || !wrist) return std::nullopt;

    RebaResult result;
    result.trunkScore = *trunk;
    result.neckScore = *neck;
    result.legScore = *legs;
    result.upperArmScore = *upperArm;
    result.lowerArmScore = *lowerArm;
    result.wristScore = *wrist;

    const int scoreA = lookupTableA(result.trunkScore, result.neckScore, result.legScore);
    const int scoreB = lookupTableB(result.upperArmScore, result.lowerArmScore, result.wristScore);
    const int scoreC = lookupTableC(scoreA, scoreB);

    result.score = MathUtil::Clamp(scoreC + ACTIVITY_SCORE, 1, 15);
    result.riskLevel = RiskLevel(result.score);
    result.action = Action(result.riskLevel);
    return result;
}

RebaRiskLevel ErgonomicScorer::RiskLevel(const int score)
{
    if (score <= 1) return RebaRiskLevel::Negligible;
    if (score <= 3) return RebaRiskLevel::Low;
    if (score <= 7) return RebaRiskLevel::Medium;
    if (score <= 10) return RebaRiskLevel::High;
    return RebaRiskLevel::VeryHigh;
}

std::string ErgonomicScorer::Action(const RebaRiskLevel level)
{
    switch (level)
    {
    case RebaRiskLevel::Negligible:
        return "No action required";
    case RebaRiskLevel::Low:
        return "May need change";
    case RebaRiskLevel::Medium:
        return "Investigation needed; implement changes";
    case RebaRiskLevel::High:
        return "Investigation and changes needed soon";
    case RebaRiskLevel::VeryHigh:
    default:
        return "Immediate investigation and changes required";
    }
}
