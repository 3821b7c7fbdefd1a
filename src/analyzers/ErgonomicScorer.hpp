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

#include "Types.hpp"
#include "clinical/ClinicalTypes.hpp"

/// @brief REBA (Rapid Entire Body Assessment) result
struct RebaResult
{
    int score{1}; // 1-15
    RebaRiskLevel riskLevel{RebaRiskLevel::Negligible};
    std::string action;

    int trunkScore{1};
    int neckScore{1};
    int legScore{1};
    int upperArmScore{1};
    int lowerArmScore{1};
    int wristScore{1};
};

/// @brief REBA scoring from joint positions (Hignett & McAtamney, 2000).
/// Load and coupling scores are 0, the activity score is +1 (sustained posture).
/// Each arm component takes the worse of the scored sides.
class ErgonomicScorer
{
private:
    static std::optional<int> scoreTrunk(const JointFrame &frame);
    static std::optional<int> scoreNeck(const JointFrame &frame);
    static std::optional<int> scoreLegs(const JointFrame &frame);
    static std::optional<int> scoreUpperArm(const JointFrame &frame, const JointName shoulder, const JointName elbow);
    static std::optional<int> scoreLowerArm(const JointFrame &frame, const JointName upper, const JointName elbow,
                                            const JointName wrist);
    static std::optional<int> scoreWrist(const JointFrame &frame, const JointName forearm, const JointName hand);

    static int lookupTableA(const int trunk, const int neck, const int legs);
    static int lookupTableB(const int upperArm, const int lowerArm, const int wrist);
    static int lookupTableC(const int scoreA, const int scoreB);

public:
    ErgonomicScorer(){};
    ~ErgonomicScorer(){};

    /// @retval std::nullopt when the trunk, neck or legs are occluded, or no arm is fully visible
    std::optional<RebaResult> Compute(const JointFrame &frame) const;

    static RebaRiskLevel RiskLevel(const int score);
    static std::string Action(const RebaRiskLevel level);
};
