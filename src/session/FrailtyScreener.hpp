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

enum class CriterionSource
{
    Measured,
    Proxy,
    SelfReport,
    Unavailable,
};

struct FrailtyCriterion
{
    std::string name;
    bool isMet;
    std::optional<double> value;
    std::optional<double> threshold;
    CriterionSource source;
};

struct FrailtyInput
{
    std::optional<double> walkingSpeedMPS;
    std::optional<double> heightM;
    BiologicalSex sex{BiologicalSex::NotSet};
    std::optional<double> dailyStepCount;
    std::optional<double> postureVariabilitySD;
    std::optional<double> strideTimeCVPercent;
    std::optional<bool> weightLossSelfReport;
};

struct FrailtyResult
{
    int friedScore{0};
    FrailtyClass classification{FrailtyClass::Robust};
    std::vector<FrailtyCriterion> criteria;
    std::string interpretation;
};

/// @brief Fried phenotype screening (Fried 2001). Grip strength cannot be measured and never counts.
class FrailtyScreener
{
public:
    FrailtyScreener(){};
    ~FrailtyScreener(){};

    FrailtyResult Screen(const FrailtyInput &input) const;

    /// @brief Sex and height stratified slowness cutoff [m/s]. Male and 1.70 m when unknown.
    static double SlownessCutoff(const std::optional<double> &heightM, const BiologicalSex sex);
};
