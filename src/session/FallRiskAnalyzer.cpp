/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "FallRiskAnalyzer.hpp"

#include <algorithm>

#include "MathUtil.hpp"
#include "clinical/ClinicalThresholds.hpp"

namespace
{
    /// @brief Higher is riskier. Linear to 50 at the threshold, then +100 per span above it.
    double ascendingSubScore(const double value, const double threshold, const double span)
    {
        if (value > threshold) return (value - threshold) / span * 100.0 + 50.0;
        return value / threshold * 50.0;
    }

    /// @brief Lower is riskier. Up to 30 points of residual risk just above the threshold.
    double descendingSubScore(const double value, const double threshold, const double span)
    {
        if (value < threshold) return (1.0 - value / threshold) * 100.0;
        return std::max(0.0, (1.0 - (value - threshold) / span) * 30.0);
    }

    void addFactor(std::vector<FallRiskFactor> &factors, const std::string &name, const double value,
                   const double threshold, const bool isElevated, const double weight, const double subScore)
    {
        factors.push_back({name, value, threshold, isElevated, weight, MathUtil::Clamp(subScore, 0.0, 100.0)});
    }
}

FallRiskAssessment FallRiskAnalyzer::Assess(const FallRiskInput &input) const
{
    FallRiskAssessment assessment;
    std::vector<FallRiskFactor> &factors = assessment.factors;

    if (input.walkingSpeedMPS)
    {
        const double speed = *input.walkingSpeedMPS;
        const double threshold = GaitThresholds::SPEED_FRAILTY;
        addFactor(factors, "Gait Speed", speed, threshold, speed < threshold, Weights::GAIT_SPEED,
                  descendingSubScore(speed, threshold, 0.6));
    }
    if (input.strideTimeCVPercent)
    {
        const double cv = *input.strideTimeCVPercent;
        const double threshold = GaitThresholds::STRIDE_TIME_CV_FALL_RISK;
        addFactor(factors, "Stride Variability", cv, threshold, cv > threshold, Weights::STRIDE_TIME_CV,
                  ascendingSubScore(cv, threshold, threshold));
    }
    if (input.doubleSupportPercent)
    {
        const double ds = *input.doubleSupportPercent;
        const double threshold = GaitThresholds::DOUBLE_SUPPORT_FALL_RISK;
        // 20 % is the normal double support, no risk below it
        const double subScore =
            ds > threshold ? (ds - threshold) / 20.0 * 100.0 + 50.0 : std::max(0.0, (ds - 20.0) / (threshold - 20.0) * 50.0);
        addFactor(factors, "Double Support", ds, threshold, ds > threshold, Weights::DOUBLE_SUPPORT, subScore);
    }
    if (input.stepWidthVariabilityCm)
    {
        const double variability = *input.stepWidthVariabilityCm;
        const double threshold = GaitThresholds::STEP_WIDTH_VARIABILITY_FALL_RISK;
        addFactor(factors, "Step Width Variability", variability, threshold, variability > threshold,
                  Weights::STEP_WIDTH_VARIABILITY, ascendingSubScore(variability, threshold, threshold));
    }
    if (input.swayVelocityMMS)
    {
        const double sway = *input.swayVelocityMMS;
        const double threshold = BalanceThresholds::SWAY_VELOCITY_FALL_RISK;
        addFactor(factors, "Trunk Sway", sway, threshold, sway > threshold, Weights::TRUNK_SWAY,
                  ascendingSubScore(sway, threshold, threshold));
    }
    if (input.stepAsymmetryPercent)
    {
        const double asymmetry = *input.stepAsymmetryPercent;
        const double threshold = GaitThresholds::SYMMETRY_NORMAL_MAX;
        addFactor(factors, "Step Asymmetry", asymmetry, threshold, asymmetry > threshold, Weights::STEP_ASYMMETRY,
                  ascendingSubScore(asymmetry, threshold, 20.0));
    }
    if (input.tugTimeSec)
    {
        const double tug = *input.tugTimeSec;
        const double threshold = GaitThresholds::TUG_FALL_RISK;
        addFactor(factors, "TUG Time", tug, threshold, tug > threshold, Weights::TUG,
                  ascendingSubScore(tug, threshold, 10.0));
    }
    if (input.footClearanceM)
    {
        const double clearance = *input.footClearanceM;
        const double threshold = GaitThresholds::FOOT_CLEARANCE_MIN;
        // reported in cm
        addFactor(factors, "Foot Clearance", clearance * 100.0, threshold * 100.0, clearance < threshold,
                  Weights::FOOT_CLEARANCE, descendingSubScore(clearance, threshold, 0.05));
    }

    double weightSum = 0.0;
    double weightedSum = 0.0;
    for (const FallRiskFactor &factor : factors)
    {
        weightSum += factor.weight;
        weightedSum += factor.subScore * factor.weight;
        if (factor.isElevated) assessment.riskFactorCount++;
    }

    double composite = 0.0;
    if (weightSum > 0.0)
    {
        const double coverage = std::min(1.0, static_cast<double>(factors.size()) / FULL_COVERAGE_FACTORS);
        composite = weightedSum / weightSum * coverage;
    }

    assessment.compositeScore = MathUtil::Clamp(composite, 0.0, 100.0);
    assessment.riskLevel = Level(assessment.compositeScore, assessment.riskFactorCount);
    return assessment;
}

FallRiskLevel FallRiskAnalyzer::Level(const double compositeScore, const int elevatedCount)
{
    if (compositeScore >= 60.0 || elevatedCount >= 4) return FallRiskLevel::High;
    if (compositeScore >= 30.0 || elevatedCount >= 2) return FallRiskLevel::Moderate;
    return FallRiskLevel::Low;
}
