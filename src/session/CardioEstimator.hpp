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

#include "clinical/ClinicalTypes.hpp"

struct CardioEstimate
{
    double estimatedMET{1.0};
    ActivityIntensity intensity{ActivityIntensity::Sedentary};
    double walkRatio{0.0}; // step length [m] / cadence [spm]
    double costOfTransportProxy{0.0};
};

struct SixMinuteWalkResult
{
    double distanceM;
    std::optional<double> predictedDistanceM;
    std::optional<double> percentPredicted;
    std::string classification;
};

struct TugResult
{
    double timeSec;
    FallRiskLevel fallRisk;
    std::string mobilityLevel;
};

/// @brief Metabolic cost from gait (ACSM walking equation) and functional test evaluation
class CardioEstimator
{
public:
    CardioEstimator(){};
    ~CardioEstimator(){};

    CardioEstimate Estimate(const double walkingSpeedMPS, const double cadenceSPM, const double strideLengthM) const;

    /// @brief Enright & Sherrill (1998) prediction needs age, height, weight and sex
    SixMinuteWalkResult EvaluateSixMinuteWalk(const double distanceM, const std::optional<int> &age,
                                              const std::optional<double> &heightM,
                                              const std::optional<double> &weightKg, const BiologicalSex sex) const;

    TugResult EvaluateTug(const double timeSec) const;
};
