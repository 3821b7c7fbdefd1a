/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <map>
#include <optional>
#include <vector>

#include "Types.hpp"
#include "clinical/Severity.hpp"

/// @brief Posture measurements of one frame.
/// The root, neck and head measures are always present, the others only when their joints are tracked.
struct PostureMetrics
{
    double trunkLeanDeg{0.0};   // sagittal, positive is forward
    double lateralLeanDeg{0.0}; // frontal, positive is to the right
    double craniovertebralAngleDeg{52.0};
    double sagittalVerticalAxisCm{0.0};
    std::optional<double> shoulderAsymmetryCm;
    std::optional<double> shoulderTiltDeg;
    std::optional<double> shoulderProtractionCm;
    std::optional<double> pelvicObliquityDeg;
    std::optional<double> pelvicTiltDeg;
    std::optional<double> thoracicKyphosisDeg;
    std::optional<double> lumbarLordosisDeg;
    std::optional<double> cervicalLordosisDeg;
    std::optional<double> coronalSpineDeviationCm;

    /// @brief Fills the fields absent here from an earlier measurement
    void FillMissing(const PostureMetrics &previous);
};

/// @brief Inputs of the composite posture score. Absent factors are left out of the weighted mean.
struct PostureScoreInput
{
    std::optional<double> cvaDeg;
    std::optional<double> svaCm;
    std::optional<double> trunkLeanDeg;
    std::optional<double> lateralLeanDeg;
    std::optional<double> shoulderAsymmetryCm;
    std::optional<double> kyphosisDeg;
    std::optional<double> pelvicObliquityDeg;
    std::optional<double> lordosisDeg;
    std::optional<double> coronalDeviationCm;

    static PostureScoreInput FromMetrics(const PostureMetrics &metrics);
};

/// @brief Sub-scores of each factor and the composite score
struct PostureScore
{
    double compositeScore{0.0};
    std::map<std::string, double> subScores; // keyed by factor name ("cva", "sva", ...)
};

struct PostureAssessment
{
    PostureMetrics metrics;
    PostureScore score;
    PosturalType posturalType{PosturalType::Ideal};
    int nyprScore{0};
    std::map<std::string, Severity> severities; // keyed by factor name
};

/// @brief Frame-level posture analysis: spine geometry, composite score, Kendall type and NYPR
class PostureAnalyzer
{
private:
    static double craniovertebralAngle(const cv::Point3d &neck, const cv::Point3d &head);
    static std::optional<double> coronalDeviationCm(const JointFrame &frame);

public:
    PostureAnalyzer(){};
    ~PostureAnalyzer(){};

    /// @brief Measure posture from one frame
    /// @retval std::nullopt when root, neck_1 or head is occluded
    std::optional<PostureMetrics> Measure(const JointFrame &frame) const;

    /// @brief Measure and score in one step
    std::optional<PostureAssessment> Analyze(const JointFrame &frame) const;

    static PostureScore ComputeScore(const PostureScoreInput &input);

    /// @brief Kendall type. A criterion whose measure is absent is not met.
    static PosturalType ClassifyKendall(const double cvaDeg, const double svaCm,
                                        const std::optional<double> &kyphosisDeg,
                                        const std::optional<double> &lordosisDeg,
                                        const std::optional<double> &pelvicTiltDeg);

    /// @brief 5 points for every measured item in the normal range
    static int ComputeNypr(const PostureMetrics &metrics);

    /// @brief Severity of every measured factor, absent factors are left out
    static std::map<std::string, Severity> ComputeSeverities(const PostureMetrics &metrics);

    /// @brief Severity of each measured joint, used to color the skeleton segments
    static std::map<JointName, Severity> JointSeverities(const std::map<std::string, Severity> &severities);
};
