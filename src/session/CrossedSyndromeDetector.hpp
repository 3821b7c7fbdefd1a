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

struct CrossedSyndromeInput
{
    double craniovertebralAngleDeg;
    double shoulderProtractionCm;
    double thoracicKyphosisDeg;
    std::optional<double> cervicalLordosisDeg;
    double pelvicTiltDeg; // positive is anterior
    double lumbarLordosisDeg;
    std::optional<double> hipFlexionRestDeg;
};

struct CrossedSyndromeResult
{
    double upperCrossedScore{0.0}; // 0-100
    double lowerCrossedScore{0.0}; // 0-100
    std::vector<CrossedSyndromeType> detectedSyndromes;
    std::vector<std::string> upperFactors;
    std::vector<std::string> lowerFactors;
};

/// @brief Janda upper and lower crossed syndromes from averaged posture markers.
/// A syndrome is reported when its score reaches 40.
class CrossedSyndromeDetector
{
public:
    static constexpr double DETECTION_SCORE = 40.0;

    CrossedSyndromeDetector(){};
    ~CrossedSyndromeDetector(){};

    CrossedSyndromeResult Detect(const CrossedSyndromeInput &input) const;
};
