/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "PainRiskEngine.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

#include "utils/StringUtil.hpp"

PainRiskAssessment PainRiskEngine::Assess(const PainRiskInput &input) const
{
    PainRiskAssessment assessment;
    assessment.alerts = {assessNeck(input),      assessShoulder(input), assessUpperBack(input),
                         assessLowerBack(input), assessHip(input),      assessKnee(input)};

    std::vector<double> scores;
    for (const PainRiskAlert &alert : assessment.alerts) scores.push_back(alert.riskScore);
    std::sort(scores.begin(), scores.end(), std::greater<double>());

    const size_t top = std::min<size_t>(3, scores.size());
    double sum = 0.0;
    for (size_t i = 0; i < top; i++) sum += scores[i];
    assessment.overallRiskScore = top > 0 ? sum / top : 0.0;
    return assessment;
}

Severity PainRiskEngine::SeverityFromScore(const double score)
{
    if (score < 25.0) return Severity::Normal;
    if (score < 50.0) return Severity::Mild;
    if (score < 75.0) return Severity::Moderate;
    return Severity::Severe;
}

PainRiskAlert PainRiskEngine::makeAlert(const PainRiskRegion region, const double risk,
                                        const std::vector<std::string> &factors, const std::string &recommendation)
{
    const double clamped = std::min(100.0, risk);
    return PainRiskAlert{region, clamped, SeverityFromScore(clamped), factors,
                         clamped > RECOMMENDATION_SCORE ? recommendation : "Continue monitoring"};
}

PainRiskAlert PainRiskEngine::assessNeck(const PainRiskInput &input)
{
    double risk = 0.0;
    std::vector<std::string> factors;
    const double cva = input.craniovertebralAngleDeg;
    if (cva < 45.0)
    {
        risk += std::min(50.0, (45.0 - cva) * 3.0);
        factors.push_back("Forward head posture (CVA " + StringUtil::Fixed(cva, 0) + " deg)");
    }
    if (input.thoracicKyphosisDeg > 50.0)
    {
        risk += std::min(25.0, (input.thoracicKyphosisDeg - 50.0) * 2.0);
        factors.push_back("Kyphosis-related cervical strain");
    }
    return makeAlert(PainRiskRegion::Neck, risk, factors,
                     "Cervical retraction exercises; monitor workstation ergonomics");
}

PainRiskAlert PainRiskEngine::assessShoulder(const PainRiskInput &input)
{
    double risk = 0.0;
    std::vector<std::string> factors;
    if (input.shoulderAsymmetryCm > 2.0)
    {
        risk += std::min(40.0, (input.shoulderAsymmetryCm - 2.0) * 10.0);
        factors.push_back("Shoulder height asymmetry (" + StringUtil::Fixed(input.shoulderAsymmetryCm, 1) + " cm)");
    }
    if (input.thoracicKyphosisDeg > 45.0)
    {
        risk += std::min(30.0, (input.thoracicKyphosisDeg - 45.0) * 2.0);
        factors.push_back("Rounded shoulders from kyphosis");
    }
    return makeAlert(PainRiskRegion::Shoulder, risk, factors, "Scapular stabilization; pectoral stretching");
}

PainRiskAlert PainRiskEngine::assessUpperBack(const PainRiskInput &input)
{
    double risk = 0.0;
    std::vector<std::string> factors;
    if (input.thoracicKyphosisDeg > 50.0)
    {
        risk += std::min(50.0, (input.thoracicKyphosisDeg - 50.0) * 3.0);
        factors.push_back("Hyperkyphosis (" + StringUtil::Fixed(input.thoracicKyphosisDeg, 0) + " deg)");
    }
    const double sva = std::abs(input.sagittalVerticalAxisCm);
    if (sva > 5.0)
    {
        risk += std::min(30.0, (sva - 5.0) * 5.0);
        factors.push_back("Sagittal imbalance (SVA " + StringUtil::Fixed(input.sagittalVerticalAxisCm, 1) + " cm)");
    }
    return makeAlert(PainRiskRegion::UpperBack, risk, factors,
                     "Thoracic extension exercises; postural awareness training");
}

PainRiskAlert PainRiskEngine::assessLowerBack(const PainRiskInput &input)
{
    double risk = 0.0;
    std::vector<std::string> factors;
    const double lordosis = input.lumbarLordosisDeg;
    if (lordosis > 60.0)
    {
        risk += std::min(30.0, (lordosis - 60.0) * 3.0);
        factors.push_back("Hyperlordosis (" + StringUtil::Fixed(lordosis, 0) + " deg)");
    }
    else if (lordosis < 30.0)
    {
        risk += std::min(30.0, (30.0 - lordosis) * 2.0);
        factors.push_back("Hypolordosis (" + StringUtil::Fixed(lordosis, 0) + " deg)");
    }

    const double sva = std::abs(input.sagittalVerticalAxisCm);
    if (sva > 7.0)
    {
        risk += std::min(25.0, (sva - 7.0) * 5.0);
        factors.push_back("Forward lean (SVA " + StringUtil::Fixed(input.sagittalVerticalAxisCm, 1) + " cm)");
    }
    const double tilt = std::abs(input.pelvicTiltDeg);
    if (tilt > 10.0)
    {
        risk += std::min(20.0, (tilt - 10.0) * 2.0);
        factors.push_back("Pelvic tilt (" + StringUtil::Fixed(input.pelvicTiltDeg, 1) + " deg)");
    }
    if (input.coronalSpineDeviationCm > 1.5)
    {
        risk += std::min(25.0, (input.coronalSpineDeviationCm - 1.5) * 8.0);
        factors.push_back("Spinal asymmetry (" + StringUtil::Fixed(input.coronalSpineDeviationCm, 1) + " cm)");
    }
    return makeAlert(PainRiskRegion::LowerBack, risk, factors,
                     "Core stabilization; lumbar-pelvic alignment exercises");
}

PainRiskAlert PainRiskEngine::assessHip(const PainRiskInput &input)
{
    double risk = 0.0;
    std::vector<std::string> factors;
    const double obliquity = std::abs(input.pelvicObliquityDeg);
    if (obliquity > 3.0)
    {
        risk += std::min(40.0, (obliquity - 3.0) * 8.0);
        factors.push_back("Pelvic obliquity (" + StringUtil::Fixed(obliquity, 1) + " deg)");
    }
    const double tilt = std::abs(input.pelvicTiltDeg);
    if (tilt > 15.0)
    {
        risk += std::min(30.0, (tilt - 15.0) * 3.0);
        factors.push_back("Pelvic tilt (" + StringUtil::Fixed(input.pelvicTiltDeg, 1) + " deg)");
    }
    if (input.gaitAsymmetryPercent && *input.gaitAsymmetryPercent > 15.0)
    {
        risk += std::min(30.0, (*input.gaitAsymmetryPercent - 15.0) * 2.0);
        factors.push_back("Gait asymmetry (" + StringUtil::Fixed(*input.gaitAsymmetryPercent, 0) + "%)");
    }
    return makeAlert(PainRiskRegion::Hip, risk, factors, "Hip abductor strengthening; pelvic alignment exercises");
}

PainRiskAlert PainRiskEngine::assessKnee(const PainRiskInput &input)
{
    double risk = 0.0;
    std::vector<std::string> factors;
    if (input.kneeFlexionStandingDeg && *input.kneeFlexionStandingDeg > 10.0)
    {
        risk += std::min(40.0, (*input.kneeFlexionStandingDeg - 10.0) * 4.0);
        factors.push_back("Knee flexion in standing (" + StringUtil::Fixed(*input.kneeFlexionStandingDeg, 1) +
                          " deg)");
    }
    if (input.gaitAsymmetryPercent && *input.gaitAsymmetryPercent > 15.0)
    {
        risk += std::min(30.0, (*input.gaitAsymmetryPercent - 15.0) * 2.0);
        factors.push_back("Gait asymmetry (" + StringUtil::Fixed(*input.gaitAsymmetryPercent, 0) + "%)");
    }
    return makeAlert(PainRiskRegion::Knee, risk, factors, "Quadriceps strengthening; gait retraining");
}
