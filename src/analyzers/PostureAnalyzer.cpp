/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "PostureAnalyzer.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

#include "MathUtil.hpp"
#include "clinical/ClinicalThresholds.hpp"

PostureScoreInput PostureScoreInput::FromMetrics(const PostureMetrics &metrics)
{
    PostureScoreInput input;
    input.cvaDeg = metrics.craniovertebralAngleDeg;
    input.svaCm = metrics.sagittalVerticalAxisCm;
    input.trunkLeanDeg = metrics.trunkLeanDeg;
    input.lateralLeanDeg = metrics.lateralLeanDeg;
    input.shoulderAsymmetryCm = metrics.shoulderAsymmetryCm;
    input.kyphosisDeg = metrics.thoracicKyphosisDeg;
    input.pelvicObliquityDeg = metrics.pelvicObliquityDeg;
    input.lordosisDeg = metrics.lumbarLordosisDeg;
    input.coronalDeviationCm = metrics.coronalSpineDeviationCm;
    return input;
}

void PostureMetrics::FillMissing(const PostureMetrics &previous)
{
    if (!shoulderAsymmetryCm) shoulderAsymmetryCm = previous.shoulderAsymmetryCm;
    if (!shoulderTiltDeg) shoulderTiltDeg = previous.shoulderTiltDeg;
    if (!shoulderProtractionCm) shoulderProtractionCm = previous.shoulderProtractionCm;
    if (!pelvicObliquityDeg) pelvicObliquityDeg = previous.pelvicObliquityDeg;
    if (!pelvicTiltDeg) pelvicTiltDeg = previous.pelvicTiltDeg;
    if (!thoracicKyphosisDeg) thoracicKyphosisDeg = previous.thoracicKyphosisDeg;
    if (!lumbarLordosisDeg) lumbarLordosisDeg = previous.lumbarLordosisDeg;
    if (!cervicalLordosisDeg) cervicalLordosisDeg = previous.cervicalLordosisDeg;
    if (!coronalSpineDeviationCm) coronalSpineDeviationCm = previous.coronalSpineDeviationCm;
}

/// @brief Angle above horizontal of the neck->head vector in the sagittal plane
double PostureAnalyzer::craniovertebralAngle(const cv::Point3d &neck, const cv::Point3d &head)
{
    const double dy = head.y - neck.y;
    const double dz = head.z - neck.z;
    if (std::hypot(dy, dz) <= 0.001) return 90.0;
    // a head behind the neck is treated as fully upright
    const double angle = std::atan2(dy, std::max(dz, 0.0)) * MathUtil::RAD2DEG;
    return MathUtil::Clamp(angle, 0.0, 90.0);
}

/// @brief Largest frontal-plane distance of the spine joints from the root->neck line [cm]
/// @retval std::nullopt when no spine joint is tracked
std::optional<double> PostureAnalyzer::coronalDeviationCm(const JointFrame &frame)
{
    const cv::Point3d *root = frame.Find(JointName::Root);
    const cv::Point3d *neck = frame.Find(JointName::Neck1);
    if (root == nullptr || neck == nullptr) return std::nullopt;

    const cv::Point3d rootFrontal(root->x, root->y, 0.0);
    const cv::Point3d neckFrontal(neck->x, neck->y, 0.0);

    std::optional<double> maxDeviation;
    for (const JointName joint : {JointName::Spine1, JointName::Spine2, JointName::Spine3, JointName::Spine4,
                                  JointName::Spine5, JointName::Spine6, JointName::Spine7})
    {
        const cv::Point3d *spine = frame.Find(joint);
        if (spine == nullptr) continue;
        const cv::Point3d spineFrontal(spine->x, spine->y, 0.0);
        const double deviation = MathUtil::PointToLineDistance(spineFrontal, rootFrontal, neckFrontal) * 100.0;
        maxDeviation = maxDeviation ? std::max(*maxDeviation, deviation) : deviation;
    }
    return maxDeviation;
}

std::optional<PostureMetrics> PostureAnalyzer::Measure(const JointFrame &frame) const
{
    const cv::Point3d *root = frame.Find(JointName::Root);
    const cv::Point3d *neck = frame.Find(JointName::Neck1);
    const cv::Point3d *head = frame.Find(JointName::Head);
    if (root == nullptr || neck == nullptr || head == nullptr) return std::nullopt;

    PostureMetrics metrics;
    const cv::Point3d trunk = *neck - *root;
    metrics.trunkLeanDeg = MathUtil::SagittalAngleFromVerticalDeg(trunk);
    metrics.lateralLeanDeg = MathUtil::FrontalAngleFromVerticalDeg(trunk);
    metrics.craniovertebralAngleDeg = craniovertebralAngle(*neck, *head);
    metrics.sagittalVerticalAxisCm = (neck->z - root->z) * 100.0;

    const cv::Point3d *leftShoulder = frame.Find(JointName::LeftShoulder);
    const cv::Point3d *rightShoulder = frame.Find(JointName::RightShoulder);
    if (leftShoulder != nullptr && rightShoulder != nullptr)
    {
        const double dy = leftShoulder->y - rightShoulder->y;
        const double width = std::hypot(leftShoulder->x - rightShoulder->x, leftShoulder->z - rightShoulder->z);
        metrics.shoulderAsymmetryCm = std::abs(dy) * 100.0;
        metrics.shoulderTiltDeg = std::atan2(dy, width) * MathUtil::RAD2DEG;

        const cv::Point3d *spine7 = frame.Find(JointName::Spine7);
        if (spine7 != nullptr)
        {
            const double midZ = (leftShoulder->z + rightShoulder->z) / 2.0;
            metrics.shoulderProtractionCm = (midZ - spine7->z) * 100.0;
        }
    }

    const cv::Point3d *leftHip = frame.Find(JointName::LeftUpLeg);
    const cv::Point3d *rightHip = frame.Find(JointName::RightUpLeg);
    if (leftHip != nullptr && rightHip != nullptr)
    {
        const double dy = leftHip->y - rightHip->y;
        const double width = std::hypot(leftHip->x - rightHip->x, leftHip->z - rightHip->z);
        metrics.pelvicObliquityDeg = std::atan2(dy, width) * MathUtil::RAD2DEG;
    }

    const cv::Point3d *spine1 = frame.Find(JointName::Spine1);
    const cv::Point3d *spine2 = frame.Find(JointName::Spine2);
    const cv::Point3d *spine3 = frame.Find(JointName::Spine3);
    const cv::Point3d *spine4 = frame.Find(JointName::Spine4);
    const cv::Point3d *spine5 = frame.Find(JointName::Spine5);
    const cv::Point3d *spine7 = frame.Find(JointName::Spine7);
    const cv::Point3d *neck2 = frame.Find(JointName::Neck2);

    if (spine1 != nullptr) metrics.pelvicTiltDeg = MathUtil::SagittalAngleFromVerticalDeg(*spine1 - *root);
    if (spine3 != nullptr && spine5 != nullptr)
    {
        metrics.thoracicKyphosisDeg = 180.0 - MathUtil::ThreePointAngleDeg(*spine3, *spine5, *neck);
    }
    if (spine2 != nullptr && spine4 != nullptr)
    {
        metrics.lumbarLordosisDeg = 180.0 - MathUtil::ThreePointAngleDeg(*root, *spine2, *spine4);
    }
    if (spine7 != nullptr && neck2 != nullptr)
    {
        metrics.cervicalLordosisDeg = 180.0 - MathUtil::ThreePointAngleDeg(*spine7, *neck2, *head);
    }
    metrics.coronalSpineDeviationCm = coronalDeviationCm(frame);

    return metrics;
}

std::optional<PostureAssessment> PostureAnalyzer::Analyze(const JointFrame &frame) const
{
    const std::optional<PostureMetrics> metrics = Measure(frame);
    if (!metrics) return std::nullopt;

    PostureAssessment assessment;
    assessment.metrics = *metrics;
    assessment.score = ComputeScore(PostureScoreInput::FromMetrics(*metrics));
    assessment.posturalType =
        ClassifyKendall(metrics->craniovertebralAngleDeg, metrics->sagittalVerticalAxisCm,
                        metrics->thoracicKyphosisDeg, metrics->lumbarLordosisDeg, metrics->pelvicTiltDeg);
    assessment.nyprScore = ComputeNypr(*metrics);
    assessment.severities = ComputeSeverities(*metrics);
    return assessment;
}

PostureScore PostureAnalyzer::ComputeScore(const PostureScoreInput &input)
{
    using namespace PostureThresholds;

    const std::vector<std::tuple<std::string, std::optional<double>, CompositeFactor>> factors = {
        {"cva", input.cvaDeg, CVA},
        {"sva", input.svaCm, SVA},
        {"trunk", input.trunkLeanDeg, TRUNK},
        {"lateral", input.lateralLeanDeg, LATERAL},
        {"shoulder", input.shoulderAsymmetryCm, SHOULDER},
        {"kyphosis", input.kyphosisDeg, KYPHOSIS},
        {"pelvic", input.pelvicObliquityDeg, PELVIC},
        {"lordosis", input.lordosisDeg, LORDOSIS},
        {"coronal", input.coronalDeviationCm, CORONAL},
    };

    PostureScore score;
    double weightedSum = 0.0;
    double weightSum = 0.0;
    for (const auto &factor : factors)
    {
        const std::optional<double> &value = std::get<1>(factor);
        if (!value) continue;

        const CompositeFactor &composite = std::get<2>(factor);
        const double subScore = SubScore(*value, composite.ideal, composite.maxDeviation);
        score.subScores[std::get<0>(factor)] = subScore;
        weightedSum += subScore * composite.weight;
        weightSum += composite.weight;
    }

    score.compositeScore = weightSum > 0.0 ? MathUtil::Clamp(weightedSum / weightSum, 0.0, 100.0) : 0.0;
    return score;
}

/// @brief Kendall postural type from the sagittal spine profile
PosturalType PostureAnalyzer::ClassifyKendall(const double cvaDeg, const double svaCm,
                                              const std::optional<double> &kyphosisDeg,
                                              const std::optional<double> &lordosisDeg,
                                              const std::optional<double> &pelvicTiltDeg)
{
    const bool forwardHead = cvaDeg < 45.0;
    const bool forwardTrunk = svaCm > 5.0;
    const bool highKyphosis = kyphosisDeg && *kyphosisDeg > 45.0;
    const bool normalKyphosis = kyphosisDeg && *kyphosisDeg <= 45.0;
    const bool highLordosis = lordosisDeg && *lordosisDeg > 55.0;
    const bool lowLordosis = lordosisDeg && *lordosisDeg < 35.0;
    const bool posteriorPelvicTilt = pelvicTiltDeg && *pelvicTiltDeg < -5.0;

    if (forwardHead && forwardTrunk && highKyphosis && highLordosis) return PosturalType::KyphosisLordosis;
    if (lowLordosis && normalKyphosis) return PosturalType::FlatBack;
    if (forwardHead && (posteriorPelvicTilt || lowLordosis) && !forwardTrunk) return PosturalType::SwayBack;
    return PosturalType::Ideal;
}

int PostureAnalyzer::ComputeNypr(const PostureMetrics &metrics)
{
    int score = 0;
    for (const auto &item : ComputeSeverities(metrics))
    {
        if (item.second == Severity::Normal) score += PostureThresholds::NYPR_ITEM_POINTS;
    }
    return score;
}

std::map<std::string, Severity> PostureAnalyzer::ComputeSeverities(const PostureMetrics &metrics)
{
    using namespace PostureThresholds;
    std::map<std::string, Severity> severities = {
        {"cva", CvaSeverity(metrics.craniovertebralAngleDeg)},
        {"sva", SvaSeverity(metrics.sagittalVerticalAxisCm)},
        {"trunk", TrunkForwardSeverity(metrics.trunkLeanDeg)},
        {"lateral", LateralLeanSeverity(metrics.lateralLeanDeg)},
    };
    if (metrics.shoulderAsymmetryCm) severities["shoulder"] = ShoulderSeverity(*metrics.shoulderAsymmetryCm);
    if (metrics.thoracicKyphosisDeg) severities["kyphosis"] = KyphosisSeverity(*metrics.thoracicKyphosisDeg);
    if (metrics.pelvicObliquityDeg) severities["pelvic"] = PelvicSeverity(*metrics.pelvicObliquityDeg);
    if (metrics.lumbarLordosisDeg) severities["lordosis"] = LordosisSeverity(*metrics.lumbarLordosisDeg);
    if (metrics.coronalSpineDeviationCm) severities["coronal"] = ScoliosisSeverity(*metrics.coronalSpineDeviationCm);
    return severities;
}

std::map<JointName, Severity> PostureAnalyzer::JointSeverities(const std::map<std::string, Severity> &severities)
{
    static const std::multimap<std::string, JointName> jointsByFactor = {
        {"cva", JointName::Head},          {"cva", JointName::Neck1},          {"sva", JointName::Neck1},
        {"sva", JointName::Root},          {"trunk", JointName::Spine7},       {"lateral", JointName::Spine4},
        {"shoulder", JointName::LeftShoulder}, {"shoulder", JointName::RightShoulder}, {"kyphosis", JointName::Spine5},
        {"lordosis", JointName::Spine2},   {"pelvic", JointName::LeftUpLeg},   {"pelvic", JointName::RightUpLeg},
        {"coronal", JointName::Spine3},
    };

    std::map<JointName, Severity> joints;
    for (const auto &item : severities)
    {
        const auto range = jointsByFactor.equal_range(item.first);
        for (auto it = range.first; it != range.second; ++it)
        {
            const auto found = joints.find(it->second);
            joints[it->second] =
                found == joints.end() ? item.second : SeverityUtil::Worse(found->second, item.second);
        }
    }
    return joints;
}
