/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "RomAnalyzer.hpp"

#include <algorithm>
#include <cmath>

#include "MathUtil.hpp"
#include "clinical/ClinicalThresholds.hpp"

namespace
{
    bool exceeds(const std::optional<double> &a, const std::optional<double> &b, const double threshold)
    {
        return a && b && std::abs(*a - *b) > threshold;
    }

    void append(std::vector<double> &history, const std::optional<double> &value)
    {
        if (value) history.push_back(*value);
    }
}

bool RomMetrics::HasSignificantAsymmetry() const
{
    const double threshold = RomThresholds::ASYMMETRY_DEG;
    return exceeds(hipFlexionLeftDeg, hipFlexionRightDeg, threshold) ||
           exceeds(kneeFlexionLeftDeg, kneeFlexionRightDeg, threshold) ||
           exceeds(armSwingLeftDeg, armSwingRightDeg, threshold);
}

void RomMetrics::FillMissing(const RomMetrics &previous)
{
    if (!hipFlexionLeftDeg) hipFlexionLeftDeg = previous.hipFlexionLeftDeg;
    if (!hipFlexionRightDeg) hipFlexionRightDeg = previous.hipFlexionRightDeg;
    if (!kneeFlexionLeftDeg) kneeFlexionLeftDeg = previous.kneeFlexionLeftDeg;
    if (!kneeFlexionRightDeg) kneeFlexionRightDeg = previous.kneeFlexionRightDeg;
    if (!pelvicTiltDeg) pelvicTiltDeg = previous.pelvicTiltDeg;
    if (!trunkRotationDeg) trunkRotationDeg = previous.trunkRotationDeg;
    if (!armSwingLeftDeg) armSwingLeftDeg = previous.armSwingLeftDeg;
    if (!armSwingRightDeg) armSwingRightDeg = previous.armSwingRightDeg;
}

/// @brief Thigh angle against the extended trunk line in the sagittal plane. Positive is flexion.
std::optional<double> RomAnalyzer::hipFlexion(const JointFrame &frame, const JointName hip, const JointName knee)
{
    const cv::Point3d *spine = frame.Find(JointName::Spine1);
    const cv::Point3d *hipJoint = frame.Find(hip);
    const cv::Point3d *kneeJoint = frame.Find(knee);
    if (spine == nullptr || hipJoint == nullptr || kneeJoint == nullptr) return std::nullopt;

    const cv::Point3d trunk = *spine - *hipJoint;
    const cv::Point3d thigh = *kneeJoint - *hipJoint;
    return MathUtil::SignedAngle2DDeg(cv::Point2d(-trunk.z, -trunk.y), cv::Point2d(thigh.z, thigh.y));
}

std::optional<double> RomAnalyzer::kneeFlexion(const JointFrame &frame, const JointName hip, const JointName knee,
                                               const JointName ankle)
{
    const cv::Point3d *hipJoint = frame.Find(hip);
    const cv::Point3d *kneeJoint = frame.Find(knee);
    const cv::Point3d *ankleJoint = frame.Find(ankle);
    if (hipJoint == nullptr || kneeJoint == nullptr || ankleJoint == nullptr) return std::nullopt;

    return 180.0 - MathUtil::ThreePointAngleDeg(*hipJoint, *kneeJoint, *ankleJoint);
}

std::optional<double> RomAnalyzer::armSwing(const JointFrame &frame, const JointName shoulder, const JointName elbow)
{
    const cv::Point3d *shoulderJoint = frame.Find(shoulder);
    const cv::Point3d *elbowJoint = frame.Find(elbow);
    if (shoulderJoint == nullptr || elbowJoint == nullptr) return std::nullopt;

    // the arm hangs down, flip it so that forward swing is positive
    const cv::Point3d arm = *elbowJoint - *shoulderJoint;
    return MathUtil::SagittalAngleFromVerticalDeg(cv::Point3d(arm.x, -arm.y, arm.z));
}

double RomAnalyzer::range(const std::vector<double> &values)
{
    if (values.empty()) return 0.0;
    const auto minMax = std::minmax_element(values.begin(), values.end());
    return *minMax.second - *minMax.first;
}

RomMetrics RomAnalyzer::Analyze(const JointFrame &frame) const
{
    RomMetrics metrics;
    metrics.hipFlexionLeftDeg = hipFlexion(frame, JointName::LeftUpLeg, JointName::LeftLeg);
    metrics.hipFlexionRightDeg = hipFlexion(frame, JointName::RightUpLeg, JointName::RightLeg);
    metrics.kneeFlexionLeftDeg = kneeFlexion(frame, JointName::LeftUpLeg, JointName::LeftLeg, JointName::LeftFoot);
    metrics.kneeFlexionRightDeg = kneeFlexion(frame, JointName::RightUpLeg, JointName::RightLeg, JointName::RightFoot);

    const cv::Point3d *root = frame.Find(JointName::Root);
    const cv::Point3d *spine1 = frame.Find(JointName::Spine1);
    if (root != nullptr && spine1 != nullptr)
    {
        metrics.pelvicTiltDeg = MathUtil::SagittalAngleFromVerticalDeg(*spine1 - *root);
    }

    const cv::Point3d *leftShoulder = frame.Find(JointName::LeftShoulder);
    const cv::Point3d *rightShoulder = frame.Find(JointName::RightShoulder);
    const cv::Point3d *leftHip = frame.Find(JointName::LeftUpLeg);
    const cv::Point3d *rightHip = frame.Find(JointName::RightUpLeg);
    if (leftShoulder != nullptr && rightShoulder != nullptr && leftHip != nullptr && rightHip != nullptr)
    {
        const cv::Point2d shoulderLine(rightShoulder->x - leftShoulder->x, rightShoulder->z - leftShoulder->z);
        const cv::Point2d pelvisLine(rightHip->x - leftHip->x, rightHip->z - leftHip->z);
        metrics.trunkRotationDeg = MathUtil::SignedAngle2DDeg(shoulderLine, pelvisLine);
    }

    metrics.armSwingLeftDeg = armSwing(frame, JointName::LeftShoulder, JointName::LeftArm);
    metrics.armSwingRightDeg = armSwing(frame, JointName::RightShoulder, JointName::RightArm);
    return metrics;
}

void RomAnalyzer::RecordFrame(const RomMetrics &metrics)
{
    append(hipFlexLeftHistory, metrics.hipFlexionLeftDeg);
    append(hipFlexRightHistory, metrics.hipFlexionRightDeg);
    append(kneeFlexLeftHistory, metrics.kneeFlexionLeftDeg);
    append(kneeFlexRightHistory, metrics.kneeFlexionRightDeg);
    append(trunkRotationHistory, metrics.trunkRotationDeg);
    append(pelvicTiltHistory, metrics.pelvicTiltDeg);
    append(armSwingLeftHistory, metrics.armSwingLeftDeg);
    append(armSwingRightHistory, metrics.armSwingRightDeg);
}

RomSessionSummary RomAnalyzer::SessionSummary() const
{
    RomSessionSummary summary;
    summary.hipRomLeftDeg = range(hipFlexLeftHistory);
    summary.hipRomRightDeg = range(hipFlexRightHistory);
    summary.kneeRomLeftDeg = range(kneeFlexLeftHistory);
    summary.kneeRomRightDeg = range(kneeFlexRightHistory);
    summary.trunkRotationRangeDeg = range(trunkRotationHistory);
    summary.pelvicTiltRangeDeg = range(pelvicTiltHistory);
    summary.armSwingLeftRangeDeg = range(armSwingLeftHistory);
    summary.armSwingRightRangeDeg = range(armSwingRightHistory);
    summary.armSwingAsymmetryPercent =
        MathUtil::RobinsonSymmetryIndex(summary.armSwingLeftRangeDeg, summary.armSwingRightRangeDeg).value_or(0.0);
    return summary;
}

void RomAnalyzer::Reset()
{
    hipFlexLeftHistory.clear();
    hipFlexRightHistory.clear();
    kneeFlexLeftHistory.clear();
    kneeFlexRightHistory.clear();
    trunkRotationHistory.clear();
    pelvicTiltHistory.clear();
    armSwingLeftHistory.clear();
    armSwingRightHistory.clear();
}
