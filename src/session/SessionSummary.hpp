/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <optional>
#include <string>

#include "Types.hpp"
#include "analyzers/BalanceAnalyzer.hpp"
#include "analyzers/GaitAnalyzer.hpp"
#include "analyzers/RomAnalyzer.hpp"
#include "session/CardioEstimator.hpp"
#include "session/CrossedSyndromeDetector.hpp"
#include "session/FallRiskAnalyzer.hpp"
#include "session/FatigueAnalyzer.hpp"
#include "session/FrailtyScreener.hpp"
#include "session/GaitPatternClassifier.hpp"
#include "session/PainRiskEngine.hpp"
#include "session/SmoothnessAnalyzer.hpp"

/// @brief Where the session distance came from, in priority order
enum class DistanceSource
{
    Pedometer,
    BodyTracking,
    StepEstimate,
    None,
};

/// @brief Fixed schema summary of one finalized capture.
/// An average is absent when no frame carried the value.
struct SessionSummary
{
    std::string date; // ISO 8601, UTC
    double startTimestamp{0.0};
    double durationSec{0.0};
    size_t frameCount{0};

    // posture averages and peaks
    std::optional<double> averageTrunkLeanDeg;
    std::optional<double> averageLateralLeanDeg;
    std::optional<double> averageCvaDeg;
    std::optional<double> averageSvaCm;
    std::optional<double> averageShoulderAsymmetryCm;
    std::optional<double> averagePelvicObliquityDeg;
    std::optional<double> averageKyphosisDeg;
    std::optional<double> averageLordosisDeg;
    std::optional<double> averageCoronalDeviationCm;
    double peakTrunkLeanDeg{0.0};
    double peakLateralLeanDeg{0.0};

    std::optional<double> postureScore;
    std::optional<int> nyprScore;
    std::optional<PosturalType> kendallType;

    // gait averages
    std::optional<double> averageCadenceSPM;
    std::optional<double> averageStrideLengthM;
    std::optional<double> averageWalkingSpeedMPS;
    GaitSessionSummary gait;

    // composite assessments
    std::optional<FallRiskAssessment> fallRisk;
    std::optional<FatigueAssessment> fatigue;
    std::optional<double> averageRebaScore;
    std::optional<int> peakRebaScore;
    std::optional<GaitPatternResult> gaitPattern;
    std::optional<CrossedSyndromeResult> crossedSyndrome;
    std::optional<PainRiskAssessment> painRisk;
    std::optional<SmoothnessMetrics> smoothness;
    std::optional<FrailtyResult> frailty;
    std::optional<CardioEstimate> cardio;
    std::optional<double> predictedSixMinuteWalkM;
    std::optional<TugResult> tug;

    // distance and steps
    std::optional<double> distanceM;
    DistanceSource distanceSource{DistanceSource::None};
    int skeletonStepCount{0};
    int imuStepCount{0};
    std::optional<int> pedometerStepCount;
    int lowConfidenceStepCount{0};

    // balance and range of motion
    std::optional<double> averageSwayVelocityMMS;
    std::optional<RombergResult> romberg;
    std::optional<RomSessionSummary> rom;
};

namespace DistanceSourceUtil
{
    std::string ToString(const DistanceSource source);
}
