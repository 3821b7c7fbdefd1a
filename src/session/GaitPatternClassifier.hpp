/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "clinical/ClinicalTypes.hpp"

/// @brief The 14 session gait features. The member order is the feature order of the inference model.
struct GaitPatternInput
{
    std::optional<double> stanceTimeLeftPercent;
    std::optional<double> stanceTimeRightPercent;
    std::optional<double> stepLengthLeftM;
    std::optional<double> stepLengthRightM;
    std::optional<double> cadenceSPM;
    std::optional<double> avgStepWidthCm;
    std::optional<double> stepWidthVariabilityCm;
    std::optional<double> pelvicObliquityDeg;
    std::optional<double> strideTimeCVPercent;
    std::optional<double> walkingSpeedMPS;
    std::optional<double> strideLengthM;
    std::optional<double> hipFlexionRomDeg;
    std::optional<double> armSwingAsymmetryPercent;
    std::optional<double> kneeFlexionRomDeg;

    std::vector<std::optional<double>> Features() const;
};

struct GaitPatternResult
{
    GaitPatternType primaryPattern{GaitPatternType::Normal};
    double confidence{1.0};
    std::map<GaitPatternType, double> patternScores; // every category, 0-1
    std::vector<std::string> flags;
};

/// @brief Rule based gait pattern classification (Perry & Burnfield 2010, Pirker 2017).
///
/// Every pathological category accumulates weighted sub-terms and is capped at 1.
/// normal = max(0, 1 - max pathological). The primary pattern is the arg-max; on a tie
/// the category declared first in GaitPatternType wins.
class GaitPatternClassifier
{
public:
    GaitPatternClassifier(){};
    ~GaitPatternClassifier(){};

    GaitPatternResult Classify(const GaitPatternInput &input) const;

    /// @brief Arg-max over the scores in declaration order. Missing categories count as 0.
    static GaitPatternType ArgMax(const std::map<GaitPatternType, double> &scores);
};
