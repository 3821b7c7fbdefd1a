/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <array>
#include <string>

#include "Types.hpp"

enum class FallRiskLevel
{
    Low,
    Moderate,
    High,
};

enum class PainRiskRegion
{
    Neck,
    Shoulder,
    UpperBack,
    LowerBack,
    Hip,
    Knee,
};

enum class CrossedSyndromeType
{
    UpperCrossed,
    LowerCrossed,
};

/// @brief Declaration order is also the arg-max tie-break order
enum class GaitPatternType
{
    Normal,
    Antalgic,
    Trendelenburg,
    Festinating,
    Circumduction,
    Ataxic,
    Waddling,
    StiffKnee,
};

const size_t NUM_GAIT_PATTERNS = 8;

enum class RebaRiskLevel
{
    Negligible,
    Low,
    Medium,
    High,
    VeryHigh,
};

enum class FrailtyClass
{
    Robust,
    PreFrail,
    Frail,
};

enum class ActivityIntensity
{
    Sedentary,
    Light,
    Moderate,
    Vigorous,
};

enum class BiologicalSex
{
    NotSet,
    Male,
    Female,
};

namespace ClinicalTypeUtil
{
    const std::array<GaitPatternType, NUM_GAIT_PATTERNS> &AllGaitPatterns();
    const std::array<PainRiskRegion, 6> &AllPainRegions();

    std::string ToString(const FallRiskLevel level);
    std::string ToString(const PainRiskRegion region);
    std::string ToString(const CrossedSyndromeType type);
    std::string ToString(const GaitPatternType pattern);
    std::string ToString(const RebaRiskLevel level);
    std::string ToString(const PosturalType type);
    std::string ToString(const FrailtyClass frailty);
    std::string ToString(const ActivityIntensity intensity);
    std::string ToString(const BiologicalSex sex);

    bool FromString(const std::string &name, PosturalType &type);
    bool FromString(const std::string &name, BiologicalSex &sex);
}
