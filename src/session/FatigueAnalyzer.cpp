/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "FatigueAnalyzer.hpp"

#include <algorithm>
#include <cmath>

#include "MathUtil.hpp"

namespace
{
    std::vector<double> head(const std::vector<double> &values, const size_t count)
    {
        return std::vector<double>(values.begin(), values.begin() + count);
    }

    std::vector<double> tail(const std::vector<double> &values, const size_t count)
    {
        return std::vector<double>(values.end() - count, values.end());
    }
}

bool FatigueAnalyzer::RecordTimePoint(const double timestamp, const double postureScore, const double trunkLeanDeg,
                                      const double lateralLeanDeg, const double cadenceSPM,
                                      const double walkingSpeedMPS)
{
    if (lastRecordedTime && timestamp - *lastRecordedTime < SAMPLING_INTERVAL_SEC) return false;
    lastRecordedTime = timestamp;

    postureScores.push_back(postureScore);
    trunkLeans.push_back(trunkLeanDeg);
    lateralLeans.push_back(std::abs(lateralLeanDeg));
    cadences.push_back(cadenceSPM);
    speeds.push_back(walkingSpeedMPS);
    return true;
}

FatigueAssessment FatigueAnalyzer::Assess() const
{
    FatigueAssessment assessment;
    if (postureScores.size() < MIN_SAMPLES) return assessment;

    const LinearFit postureTrend = MathUtil::LinearRegression(postureScores);
    const LinearFit cadenceTrend = MathUtil::LinearRegression(cadences);
    const LinearFit speedTrend = MathUtil::LinearRegression(speeds);
    const LinearFit leanTrend = MathUtil::LinearRegression(trunkLeans);
    const LinearFit lateralTrend = MathUtil::LinearRegression(lateralLeans);

    const size_t third = postureScores.size() / 3;
    const std::vector<double> firstPosture = head(postureScores, third);
    const std::vector<double> lastPosture = tail(postureScores, third);

    double index = 0.0;

    const double postureDrop = MathUtil::Mean(firstPosture) - MathUtil::Mean(lastPosture);
    if (postureDrop > 0.0) index += std::min(40.0, postureDrop * 4.0);

    const double sdIncrease = MathUtil::StandardDeviation(lastPosture) - MathUtil::StandardDeviation(firstPosture);
    if (sdIncrease > 0.0) index += std::min(20.0, sdIncrease * 10.0);

    if (leanTrend.slope > 0.0) index += std::min(15.0, leanTrend.slope * 50.0);
    if (speedTrend.slope < 0.0) index += std::min(10.0, std::abs(speedTrend.slope) * 100.0);

    // slowing down and compensatory short fast steps both count
    const double cadenceFirst = MathUtil::Mean(head(cadences, third));
    const double cadenceLast = MathUtil::Mean(tail(cadences, third));
    const double cadenceChangePercent =
        cadenceFirst > 0.0 ? std::abs(cadenceLast - cadenceFirst) / cadenceFirst * 100.0 : 0.0;
    if (cadenceChangePercent > 5.0) index += std::min(10.0, cadenceChangePercent * 1.5);

    if (lateralTrend.slope > 0.0) index += std::min(5.0, lateralTrend.slope * 25.0);

    assessment.fatigueIndex = MathUtil::Clamp(index, 0.0, 100.0);
    assessment.postureVariabilitySD = MathUtil::StandardDeviation(postureScores);
    assessment.postureTrendSlope = postureTrend.slope;
    assessment.postureTrendR2 = postureTrend.rSquared;
    assessment.cadenceTrendSlope = cadenceTrend.slope;
    assessment.speedTrendSlope = speedTrend.slope;
    assessment.forwardLeanTrendSlope = leanTrend.slope;
    assessment.lateralSwayTrendSlope = lateralTrend.slope;
    assessment.isFatigued = index > 25.0 || (postureDrop > 5.0 && postureTrend.rSquared > 0.3);
    return assessment;
}

void FatigueAnalyzer::Reset()
{
    lastRecordedTime.reset();
    postureScores.clear();
    trunkLeans.clear();
    lateralLeans.clear();
    cadences.clear();
    speeds.clear();
}
