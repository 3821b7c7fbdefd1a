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
#include "clinical/Severity.hpp"

struct PainRiskInput
{
    double craniovertebralAngleDeg;
    double sagittalVerticalAxisCm;
    double thoracicKyphosisDeg;
    double lumbarLordosisDeg;
    double shoulderAsymmetryCm;
    double pelvicObliquityDeg;
    double pelvicTiltDeg;
    double coronalSpineDeviationCm;
    std::optional<double> kneeFlexionStandingDeg;
    std::optional<double> gaitAsymmetryPercent;
};

struct PainRiskAlert
{
    PainRiskRegion region;
    double riskScore; // 0-100
    Severity severity;
    std::vector<std::string> factors;
    std::string recommendation;
};

struct PainRiskAssessment
{
    std::vector<PainRiskAlert> alerts; // one per region, in region order
    double overallRiskScore{0.0};      // mean of the three highest regions
};

/// @brief Pain risk per body region from postural and gait deviations
class PainRiskEngine
{
private:
    static PainRiskAlert makeAlert(const PainRiskRegion region, const double risk,
                                   const std::vector<std::string> &factors, const std::string &recommendation);

    static PainRiskAlert assessNeck(const PainRiskInput &input);
    static PainRiskAlert assessShoulder(const PainRiskInput &input);
    static PainRiskAlert assessUpperBack(const PainRiskInput &input);
    static PainRiskAlert assessLowerBack(const PainRiskInput &input);
    static PainRiskAlert assessHip(const PainRiskInput &input);
    static PainRiskAlert assessKnee(const PainRiskInput &input);

public:
    static constexpr double RECOMMENDATION_SCORE = 40.0;

    PainRiskEngine(){};
    ~PainRiskEngine(){};

    PainRiskAssessment Assess(const PainRiskInput &input) const;

    /// @brief < 25 normal, < 50 mild, < 75 moderate, else severe
    static Severity SeverityFromScore(const double score);
};
