/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "CrossedSyndromeDetector.hpp"

#include <algorithm>

#include "utils/StringUtil.hpp"

CrossedSyndromeResult CrossedSyndromeDetector::Detect(const CrossedSyndromeInput &input) const
{
    CrossedSyndromeResult result;

    // upper: forward head, protracted shoulders, kyphosis, compensatory cervical lordosis
    double upper = 0.0;
    if (input.craniovertebralAngleDeg < 45.0)
    {
        upper += std::min(30.0, (45.0 - input.craniovertebralAngleDeg) * 2.0);
        result.upperFactors.push_back("Forward head (CVA " + StringUtil::Fixed(input.craniovertebralAngleDeg, 1) +
                                      " deg)");
    }
    if (input.shoulderProtractionCm > 2.0)
    {
        upper += std::min(25.0, (input.shoulderProtractionCm - 2.0) * 5.0);
        result.upperFactors.push_back("Shoulder protraction (" + StringUtil::Fixed(input.shoulderProtractionCm, 1) +
                                      " cm)");
    }
    if (input.thoracicKyphosisDeg > 45.0)
    {
        upper += std::min(25.0, (input.thoracicKyphosisDeg - 45.0) * 2.0);
        result.upperFactors.push_back("Increased kyphosis (" + StringUtil::Fixed(input.thoracicKyphosisDeg, 1) +
                                      " deg)");
    }
    if (input.cervicalLordosisDeg && *input.cervicalLordosisDeg > 20.0)
    {
        upper += std::min(20.0, (*input.cervicalLordosisDeg - 20.0) * 2.0);
        result.upperFactors.push_back("Cervical hyperlordosis (" + StringUtil::Fixed(*input.cervicalLordosisDeg, 1) +
                                      " deg)");
    }
    result.upperCrossedScore = std::min(100.0, upper);

    // lower: anterior pelvic tilt, lumbar hyperlordosis, tight hip flexors
    double lower = 0.0;
    if (input.pelvicTiltDeg > 10.0)
    {
        lower += std::min(35.0, (input.pelvicTiltDeg - 10.0) * 3.0);
        result.lowerFactors.push_back("Anterior pelvic tilt (" + StringUtil::Fixed(input.pelvicTiltDeg, 1) + " deg)");
    }
    if (input.lumbarLordosisDeg > 60.0)
    {
        lower += std::min(35.0, (input.lumbarLordosisDeg - 60.0) * 2.5);
        result.lowerFactors.push_back("Lumbar hyperlordosis (" + StringUtil::Fixed(input.lumbarLordosisDeg, 1) +
                                      " deg)");
    }
    if (input.hipFlexionRestDeg && *input.hipFlexionRestDeg > 5.0)
    {
        lower += std::min(30.0, (*input.hipFlexionRestDeg - 5.0) * 3.0);
        result.lowerFactors.push_back("Hip flexor tightness (" + StringUtil::Fixed(*input.hipFlexionRestDeg, 1) +
                                      " deg)");
    }
    result.lowerCrossedScore = std::min(100.0, lower);

    if (result.upperCrossedScore >= DETECTION_SCORE)
    {
        result.detectedSyndromes.push_back(CrossedSyndromeType::UpperCrossed);
    }
    if (result.lowerCrossedScore >= DETECTION_SCORE)
    {
        result.detectedSyndromes.push_back(CrossedSyndromeType::LowerCrossed);
    }
    return result;
}
