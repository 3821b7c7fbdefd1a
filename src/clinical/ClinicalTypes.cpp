/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "ClinicalTypes.hpp"

const std::array<GaitPatternType, NUM_GAIT_PATTERNS> &ClinicalTypeUtil::AllGaitPatterns()
{
    static const std::array<GaitPatternType, NUM_GAIT_PATTERNS> patterns = {
        GaitPatternType::Normal,        GaitPatternType::Antalgic, GaitPatternType::Trendelenburg,
        GaitPatternType::Festinating,   GaitPatternType::Circumduction, GaitPatternType::Ataxic,
        GaitPatternType::Waddling,      GaitPatternType::StiffKnee,
    };
    return patterns;
}

const std::array<PainRiskRegion, 6> &ClinicalTypeUtil::AllPainRegions()
{
    static const std::array<PainRiskRegion, 6> regions = {
        PainRiskRegion::Neck,      PainRiskRegion::Shoulder, PainRiskRegion::UpperBack,
        PainRiskRegion::LowerBack, PainRiskRegion::Hip,      PainRiskRegion::Knee,
    };
    return regions;
}

std::string ClinicalTypeUtil::ToString(const FallRiskLevel level)
{
    switch (level)
    {
    case FallRiskLevel::Low:
        return "low";
    case FallRiskLevel::Moderate:
        return "moderate";
    case FallRiskLevel::High:
        return "high";
    }
    return "low";
}

std::string ClinicalTypeUtil::ToString(const PainRiskRegion region)
{
    switch (region)
    {
    case PainRiskRegion::Neck:
        return "neck";
    case PainRiskRegion::Shoulder:
        return "shoulder";
    case PainRiskRegion::UpperBack:
        return "upperBack";
    case PainRiskRegion::LowerBack:
        return "lowerBack";
    case PainRiskRegion::Hip:
        return "hip";
    case PainRiskRegion::Knee:
        return "knee";
    }
    return "neck";
}

std::string ClinicalTypeUtil::ToString(const CrossedSyndromeType type)
{
    return type == CrossedSyndromeType::UpperCrossed ? "upperCrossed" : "lowerCrossed";
}

std::string ClinicalTypeUtil::ToString(const GaitPatternType pattern)
{
    switch (pattern)
    {
    case GaitPatternType::Normal:
        return "normal";
    case GaitPatternType::Antalgic:
        return "antalgic";
    case GaitPatternType::Trendelenburg:
        return "trendelenburg";
    case GaitPatternType::Festinating:
        return "festinating";
    case GaitPatternType::Circumduction:
        return "circumduction";
    case GaitPatternType::Ataxic:
        return "ataxic";
    case GaitPatternType::Waddling:
        return "waddling";
    case GaitPatternType::StiffKnee:
        return "stiffKnee";
    }
    return "normal";
}

std::string ClinicalTypeUtil::ToString(const RebaRiskLevel level)
{
    switch (level)
    {
    case RebaRiskLevel::Negligible:
        return "negligible";
    case RebaRiskLevel::Low:
        return "low";
    case RebaRiskLevel::Medium:
        return "medium";
    case RebaRiskLevel::High:
        return "high";
    case RebaRiskLevel::VeryHigh:
        return "veryHigh";
    }
    return "negligible";
}

std::string ClinicalTypeUtil::ToString(const PosturalType type)
{
    switch (type)
    {
    case PosturalType::Ideal:
        return "ideal";
    case PosturalType::KyphosisLordosis:
        return "kyphosisLordosis";
    case PosturalType::FlatBack:
        return "flatBack";
    case PosturalType::SwayBack:
        return "swayBack";
    }
    return "ideal";
}

std::string ClinicalTypeUtil::ToString(const FrailtyClass frailty)
{
    switch (frailty)
    {
    case FrailtyClass::Robust:
        return "robust";
    case FrailtyClass::PreFrail:
        return "preFrail";
    case FrailtyClass::Frail:
        return "frail";
    }
    return "robust";
}

std::string ClinicalTypeUtil::ToString(const ActivityIntensity intensity)
{
    switch (intensity)
    {
    case ActivityIntensity::Sedentary:
        return "sedentary";
    case ActivityIntensity::Light:
        return "light";
    case ActivityIntensity::Moderate:
        return "moderate";
    case ActivityIntensity::Vigorous:
        return "vigorous";
    }
    return "sedentary";
}

std::string ClinicalTypeUtil::ToString(const BiologicalSex sex)
{
    switch (sex)
    {
    case BiologicalSex::Male:
        return "male";
    case BiologicalSex::Female:
        return "female";
    default:
        return "notSet";
    }
}

bool ClinicalTypeUtil::FromString(const std::string &name, PosturalType &type)
{
    for (const PosturalType candidate :
         {PosturalType::Ideal, PosturalType::KyphosisLordosis, PosturalType::FlatBack, PosturalType::SwayBack})
    {
        if (ToString(candidate) == name)
        {
            type = candidate;
            return true;
        }
    }
    return false;
}

bool ClinicalTypeUtil::FromString(const std::string &name, BiologicalSex &sex)
{
    for (const BiologicalSex candidate : {BiologicalSex::NotSet, BiologicalSex::Male, BiologicalSex::Female})
    {
        if (ToString(candidate) == name)
        {
            sex = candidate;
            return true;
        }
    }
    return false;
}
