/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "GaitPatternClassifier.hpp"

#include <algorithm>
#include <cmath>

#include "utils/StringUtil.hpp"

std::vector<std::optional<double>> GaitPatternInput::Features() const
{
    return {stanceTimeLeftPercent, stanceTimeRightPercent, stepLengthLeftM,      stepLengthRightM,
            cadenceSPM,            avgStepWidthCm,         stepWidthVariabilityCm, pelvicObliquityDeg,
            strideTimeCVPercent,   walkingSpeedMPS,        strideLengthM,          hipFlexionRomDeg,
            armSwingAsymmetryPercent, kneeFlexionRomDeg};
}

GaitPatternResult GaitPatternClassifier::Classify(const GaitPatternInput &input) const
{
    GaitPatternResult result;
    std::vector<std::string> &flags = result.flags;

    std::optional<double> stanceAsymmetry;
    if (input.stanceTimeLeftPercent && input.stanceTimeRightPercent)
    {
        stanceAsymmetry = std::abs(*input.stanceTimeLeftPercent - *input.stanceTimeRightPercent);
    }

    // antalgic: short stance on the painful side, uneven steps, slow
    double antalgic = 0.0;
    if (stanceAsymmetry && *stanceAsymmetry > 5.0)
    {
        antalgic += std::min(1.0, *stanceAsymmetry / 15.0) * 0.5;
        flags.push_back("Stance asymmetry: " + StringUtil::Fixed(*stanceAsymmetry, 1) + "%");
    }
    if (input.stepLengthLeftM && input.stepLengthRightM)
    {
        const double stepDifference = std::abs(*input.stepLengthLeftM - *input.stepLengthRightM);
        if (stepDifference > 0.05) antalgic += std::min(1.0, stepDifference / 0.15) * 0.3;
    }
    if (input.walkingSpeedMPS && *input.walkingSpeedMPS < 0.8) antalgic += 0.2;

    // trendelenburg: pelvic drop with a unilateral stance asymmetry
    double trendelenburg = 0.0;
    if (input.pelvicObliquityDeg && std::abs(*input.pelvicObliquityDeg) > 5.0)
    {
        const double obliquity = std::abs(*input.pelvicObliquityDeg);
        trendelenburg += std::min(1.0, obliquity / 12.0) * 0.7;
        flags.push_back("Pelvic obliquity: " + StringUtil::Fixed(obliquity, 1) + " deg");
    }
    if (stanceAsymmetry && *stanceAsymmetry > 3.0 && *stanceAsymmetry < 15.0) trendelenburg += 0.3;

    // festinating: fast short steps
    double festinating = 0.0;
    if (input.cadenceSPM && *input.cadenceSPM > 140.0)
    {
        festinating += std::min(1.0, (*input.cadenceSPM - 140.0) / 40.0) * 0.4;
        flags.push_back("Elevated cadence: " + StringUtil::Fixed(*input.cadenceSPM, 0) + " SPM");
    }
    if (input.strideLengthM && *input.strideLengthM < 0.5)
    {
        festinating += std::min(1.0, (0.5 - *input.strideLengthM) / 0.3) * 0.4;
    }
    if (input.armSwingAsymmetryPercent && *input.armSwingAsymmetryPercent > 20.0)
    {
        festinating += 0.2;
        flags.push_back("Arm swing asymmetry: " + StringUtil::Fixed(*input.armSwingAsymmetryPercent, 0) + "%");
    }

    // ataxic: wide and irregular base
    double ataxic = 0.0;
    if (input.avgStepWidthCm && *input.avgStepWidthCm > 15.0)
    {
        ataxic += std::min(1.0, (*input.avgStepWidthCm - 15.0) / 10.0) * 0.4;
        flags.push_back("Wide base: " + StringUtil::Fixed(*input.avgStepWidthCm, 1) + " cm");
    }
    if (input.stepWidthVariabilityCm && *input.stepWidthVariabilityCm > 3.0)
    {
        ataxic += std::min(1.0, (*input.stepWidthVariabilityCm - 3.0) / 4.0) * 0.3;
    }
    if (input.strideTimeCVPercent && *input.strideTimeCVPercent > 8.0)
    {
        ataxic += std::min(1.0, (*input.strideTimeCVPercent - 8.0) / 10.0) * 0.3;
    }

    // waddling: bilateral trendelenburg, symmetric stance
    double waddling = 0.0;
    if (input.pelvicObliquityDeg && std::abs(*input.pelvicObliquityDeg) > 8.0) waddling += 0.5;
    if (input.avgStepWidthCm && *input.avgStepWidthCm > 13.0) waddling += 0.3;
    if (stanceAsymmetry && *stanceAsymmetry < 3.0 &&
        (*input.stanceTimeLeftPercent > 63.0 || *input.stanceTimeRightPercent > 63.0))
    {
        waddling += 0.2;
    }

    // circumduction: lateral swing arc with little hip flexion
    double circumduction = 0.0;
    if (input.hipFlexionRomDeg && *input.hipFlexionRomDeg < 25.0)
    {
        circumduction += std::min(1.0, (25.0 - *input.hipFlexionRomDeg) / 15.0) * 0.5;
    }
    if (input.avgStepWidthCm && *input.avgStepWidthCm > 13.0) circumduction += 0.3;
    if (input.walkingSpeedMPS && *input.walkingSpeedMPS < 0.7) circumduction += 0.2;

    // stiff knee: swing knee flexion below the normal 60-70 deg
    double stiffKnee = 0.0;
    if (input.kneeFlexionRomDeg && *input.kneeFlexionRomDeg < 50.0)
    {
        stiffKnee += std::min(1.0, (50.0 - *input.kneeFlexionRomDeg) / 30.0) * 0.5;
        flags.push_back("Reduced knee flexion ROM: " + StringUtil::Fixed(*input.kneeFlexionRomDeg, 0) + " deg");
    }
    if (input.hipFlexionRomDeg && *input.hipFlexionRomDeg < 25.0) stiffKnee += 0.2;
    if (input.walkingSpeedMPS && *input.walkingSpeedMPS < 0.8) stiffKnee += 0.2;
    if (circumduction > 0.3) stiffKnee += 0.1;

    std::map<GaitPatternType, double> &scores = result.patternScores;
    scores[GaitPatternType::Antalgic] = std::min(1.0, antalgic);
    scores[GaitPatternType::Trendelenburg] = std::min(1.0, trendelenburg);
    scores[GaitPatternType::Festinating] = std::min(1.0, festinating);
    scores[GaitPatternType::Ataxic] = std::min(1.0, ataxic);
    scores[GaitPatternType::Waddling] = std::min(1.0, waddling);
    scores[GaitPatternType::Circumduction] = std::min(1.0, circumduction);
    scores[GaitPatternType::StiffKnee] = std::min(1.0, stiffKnee);

    double maxPathological = 0.0;
    for (const auto &score : scores) maxPathological = std::max(maxPathological, score.second);
    scores[GaitPatternType::Normal] = std::max(0.0, 1.0 - maxPathological);

    result.primaryPattern = ArgMax(scores);
    result.confidence = scores[result.primaryPattern];
    return result;
}

GaitPatternType GaitPatternClassifier::ArgMax(const std::map<GaitPatternType, double> &scores)
{
    GaitPatternType best = GaitPatternType::Normal;
    double bestScore = -1.0;
    for (const GaitPatternType pattern : ClinicalTypeUtil::AllGaitPatterns())
    {
        const auto it = scores.find(pattern);
        const double score = it == scores.end() ? 0.0 : it->second;
        // strictly greater keeps the earlier category on a tie
        if (score > bestScore)
        {
            best = pattern;
            bestScore = score;
        }
    }
    return best;
}
