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
#include <vector>

struct FatigueAssessment
{
    double fatigueIndex{0.0}; // 0-100
    double postureVariabilitySD{0.0};
    double postureTrendSlope{0.0};
    double postureTrendR2{0.0};
    double cadenceTrendSlope{0.0};
    double speedTrendSlope{0.0};
    double forwardLeanTrendSlope{0.0};
    double lateralSwayTrendSlope{0.0};
    bool isFatigued{false};
};

/// @brief Fatigue from the trend of posture and gait over the session.
///
/// Time points are kept at most every 2 s. Regressions are taken against the sample index.
class FatigueAnalyzer
{
private:
    static const size_t MIN_SAMPLES = 20;
    static constexpr double SAMPLING_INTERVAL_SEC = 2.0;

    std::optional<double> lastRecordedTime;
    std::vector<double> postureScores;
    std::vector<double> trunkLeans;
    std::vector<double> lateralLeans;
    std::vector<double> cadences;
    std::vector<double> speeds;

public:
    FatigueAnalyzer(){};
    ~FatigueAnalyzer(){};

    /// @retval false when the time point was dropped by the sampling interval
    bool RecordTimePoint(const double timestamp, const double postureScore, const double trunkLeanDeg,
                         const double lateralLeanDeg, const double cadenceSPM, const double walkingSpeedMPS);

    /// @brief All zero and not fatigued below 20 time points
    FatigueAssessment Assess() const;

    size_t SampleCount() const { return postureScores.size(); }
    bool HasEnoughSamples() const { return postureScores.size() >= MIN_SAMPLES; }

    void Reset();
};
