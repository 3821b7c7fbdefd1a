/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "CardioEstimator.hpp"

#include <algorithm>

#include "clinical/ClinicalThresholds.hpp"

CardioEstimate CardioEstimator::Estimate(const double walkingSpeedMPS, const double cadenceSPM,
                                         const double strideLengthM) const
{
    CardioEstimate estimate;

    // VO2 [ml/kg/min] = 0.1 * speed [m/min] + 3.5, 1 MET = 3.5 ml/kg/min
    const double vo2 = 0.1 * walkingSpeedMPS * 60.0 + 3.5;
    estimate.estimatedMET = vo2 / 3.5;

    if (estimate.estimatedMET < 1.5)
        estimate.intensity = ActivityIntensity::Sedentary;
    else if (estimate.estimatedMET < 3.0)
        estimate.intensity = ActivityIntensity::Light;
    else if (estimate.estimatedMET < 6.0)
        estimate.intensity = ActivityIntensity::Moderate;
    else
        estimate.intensity = ActivityIntensity::Vigorous;

    estimate.walkRatio = cadenceSPM > 0.0 ? (strideLengthM / 2.0) / cadenceSPM : 0.0;
    estimate.costOfTransportProxy = walkingSpeedMPS > 0.1 ? estimate.estimatedMET / walkingSpeedMPS : 0.0;
    return estimate;
}

SixMinuteWalkResult CardioEstimator::EvaluateSixMinuteWalk(const double distanceM, const std::optional<int> &age,
                                                           const std::optional<double> &heightM,
                                                           const std::optional<double> &weightKg,
                                                           const BiologicalSex sex) const
{
    SixMinuteWalkResult result;
    result.distanceM = distanceM;

    if (age && heightM && weightKg && sex != BiologicalSex::NotSet)
    {
        const double heightCm = *heightM * 100.0;
        double predicted = 0.0;
        if (sex == BiologicalSex::Male)
            predicted = 7.57 * heightCm - 5.02 * *age - 1.76 * *weightKg - 309.0;
        else
            predicted = 2.11 * heightCm - 2.29 * *weightKg - 5.78 * *age + 667.0;

        result.predictedDistanceM = std::max(0.0, predicted);
        if (*result.predictedDistanceM > 0.0)
        {
            result.percentPredicted = distanceM / *result.predictedDistanceM * 100.0;
        }
    }

    if (distanceM < 300.0)
        result.classification = "Severely limited functional capacity";
    else if (distanceM < 400.0)
        result.classification = "Moderate functional limitation";
    else if (distanceM < 500.0)
        result.classification = "Mild limitation";
    else
        result.classification = "Normal functional capacity";
    return result;
}

/// @brief Shumway-Cook 2000 fall risk bands
TugResult CardioEstimator::EvaluateTug(const double timeSec) const
{
    TugResult result;
    result.timeSec = timeSec;

    if (timeSec > GaitThresholds::TUG_FALL_RISK)
        result.fallRisk = FallRiskLevel::High;
    else if (timeSec > 10.0)
        result.fallRisk = FallRiskLevel::Moderate;
    else
        result.fallRisk = FallRiskLevel::Low;

    if (timeSec < 10.0)
        result.mobilityLevel = "Freely mobile";
    else if (timeSec < 20.0)
        result.mobilityLevel = "Mostly independent";
    else if (timeSec < 30.0)
        result.mobilityLevel = "Variable mobility";
    else
        result.mobilityLevel = "Impaired mobility; assistive device may be needed";
    return result;
}
