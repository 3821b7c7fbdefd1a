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

#include "Types.hpp"
#include "analyzers/BalanceAnalyzer.hpp"
#include "analyzers/ErgonomicScorer.hpp"
#include "analyzers/GaitAnalyzer.hpp"
#include "analyzers/PostureAnalyzer.hpp"
#include "analyzers/RomAnalyzer.hpp"

/// @brief Monotonic tick counter of the recording state. The first recorded tick is 1.
class FrameIndex
{
private:
    long long value;

public:
    FrameIndex() : value(0){};

    void Advance() { value++; }
    void Reset() { value = 0; }
    long long Value() const { return value; }

    /// @brief true every period-th tick
    bool IsDue(const int period) const { return period > 0 && value % period == 0; }
};

/// @brief Last value of every analyzer. A throttled analyzer keeps its cell between runs.
struct LiveMetrics
{
    std::optional<PostureAssessment> posture;
    GaitMetrics gait;
    std::optional<RomMetrics> rom;
    std::optional<BalanceMetrics> balance;
    std::optional<RebaResult> reba;
    std::optional<double> imuCadenceSPM;
    std::optional<int> calibrationCountdown;
    long long frameIndex{0};

    /// @brief Replaces the posture cell. Measures occluded in this assessment keep their cached value.
    void UpdatePosture(const PostureAssessment &assessment);

    /// @brief Replaces the ROM cell angle by angle, occluded angles keep their cached value
    void UpdateRom(const RomMetrics &metrics);

    /// @brief Recorded instant built from the cells
    BodyFrame ToBodyFrame(const JointFrame &frame) const;
};
