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
#include <vector>

#include "clinical/ClinicalTypes.hpp"

/// @brief Session values used by the fall-risk screening. Absent values are excluded from the composite.
struct FallRiskInput
{
    std::optional<double> walkingSpeedMPS;
    std::optional<double> strideTimeCVPercent;
    std::optional<double> doubleSupportPercent;
    std::optional<double> stepWidthVariabilityCm;
    std::optional<double> swayVelocityMMS;
    std::optional<double> stepAsymmetryPercent;
    std::optional<double> tugTimeSec;
    std::optional<double> footClearanceM;
};

struct FallRiskFactor
{
    std::string name;
    double value;
    double threshold;
    bool isElevated;
    double weight;
    double subScore; // 0 no risk, 100 maximum risk
};

struct FallRiskAssessment
{
    double compositeScore{0.0};
    FallRiskLevel riskLevel{FallRiskLevel::Low};
    std::vector<FallRiskFactor> factors;
    int riskFactorCount{0};
};

/// @brief Composite fall-risk screening from gait and balance parameters.
///
/// Each present factor gives a 0-100 sub-score. The composite is the weighted
/// mean over the present factors, scaled by min(1, present / 3) so that an
/// assessment built from one or two factors is attenuated.
class FallRiskAnalyzer
{
private:
    static const size_t FULL_COVERAGE_FACTORS = 3;

public:
    struct Weights
    {
        static constexpr double GAIT_SPEED = 0.25;
        static constexpr double STRIDE_TIME_CV = 0.20;
        static constexpr double DOUBLE_SUPPORT = 0.10;
        static constexpr double STEP_WIDTH_VARIABILITY = 0.10;
        static constexpr double TRUNK_SWAY = 0.10;
        static constexpr double STEP_ASYMMETRY = 0.10;
        static constexpr double TUG = 0.10;
        static constexpr double FOOT_CLEARANCE = 0.05;
    };

    FallRiskAnalyzer(){};
    ~FallRiskAnalyzer(){};

    FallRiskAssessment Assess(const FallRiskInput &input) const;

    /// @brief high when score >= 60 or 4+ factors are elevated, moderate when >= 30 or 2+
    static FallRiskLevel Level(const double compositeScore, const int elevatedCount);
};
