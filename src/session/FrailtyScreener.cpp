/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "FrailtyScreener.hpp"

namespace
{
    const double LOW_ACTIVITY_STEPS = 3000.0;
    const double EXHAUSTION_STRIDE_CV = 6.0;
    const double EXHAUSTION_POSTURE_SD = 5.0;
}

double FrailtyScreener::SlownessCutoff(const std::optional<double> &heightM, const BiologicalSex sex)
{
    const double height = heightM.value_or(1.70);
    if (sex == BiologicalSex::Female) return height <= 1.59 ? 0.65 : 0.76;
    return height <= 1.73 ? 0.65 : 0.76;
}

FrailtyResult FrailtyScreener::Screen(const FrailtyInput &input) const
{
    FrailtyResult result;
    std::vector<FrailtyCriterion> &criteria = result.criteria;

    if (input.walkingSpeedMPS)
    {
        const double threshold = SlownessCutoff(input.heightM, input.sex);
        criteria.push_back({"Slowness (Gait Speed)", *input.walkingSpeedMPS < threshold, input.walkingSpeedMPS,
                            threshold, CriterionSource::Measured});
    }
    else
    {
        criteria.push_back({"Slowness (Gait Speed)", false, std::nullopt, std::nullopt, CriterionSource::Unavailable});
    }

    if (input.dailyStepCount)
    {
        criteria.push_back({"Low Physical Activity", *input.dailyStepCount < LOW_ACTIVITY_STEPS, input.dailyStepCount,
                            LOW_ACTIVITY_STEPS, CriterionSource::Proxy});
    }
    else
    {
        criteria.push_back({"Low Physical Activity", false, std::nullopt, std::nullopt, CriterionSource::Unavailable});
    }

    // motor exhaustion proxy: variable gait and variable posture together
    if (input.postureVariabilitySD && input.strideTimeCVPercent)
    {
        const bool exhausted =
            *input.strideTimeCVPercent > EXHAUSTION_STRIDE_CV && *input.postureVariabilitySD > EXHAUSTION_POSTURE_SD;
        criteria.push_back(
            {"Exhaustion", exhausted, input.strideTimeCVPercent, EXHAUSTION_STRIDE_CV, CriterionSource::Proxy});
    }
    else
    {
        criteria.push_back({"Exhaustion", false, std::nullopt, std::nullopt, CriterionSource::SelfReport});
    }

    criteria.push_back({"Weakness (Grip Strength)", false, std::nullopt, std::nullopt, CriterionSource::Unavailable});
    criteria.push_back({"Unintentional Weight Loss", input.weightLossSelfReport.value_or(false), std::nullopt,
                        std::nullopt, CriterionSource::SelfReport});

    int pending = 0;
    for (const FrailtyCriterion &criterion : criteria)
    {
        if (criterion.isMet) result.friedScore++;
        if (!criterion.isMet &&
            (criterion.source == CriterionSource::Unavailable || criterion.source == CriterionSource::SelfReport))
        {
            pending++;
        }
    }

    const std::string count = std::to_string(result.friedScore);
    if (result.friedScore == 0)
    {
        result.classification = FrailtyClass::Robust;
        result.interpretation = "No frailty indicators detected from available data. " + std::to_string(pending) +
                                " criteria require clinical assessment.";
    }
    else if (result.friedScore <= 2)
    {
        result.classification = FrailtyClass::PreFrail;
        result.interpretation = "Pre-frailty indicators present (" + count +
                                " of 5 criteria). Consider comprehensive geriatric assessment.";
    }
    else
    {
        result.classification = FrailtyClass::Frail;
        result.interpretation =
            "Multiple frailty indicators (" + count + " of 5). Recommend clinical evaluation by geriatrician.";
    }
    return result;
}
