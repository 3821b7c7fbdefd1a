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
#include <deque>
#include <optional>
#include <vector>

#include "Types.hpp"

/// @brief Live gait values after one frame
struct GaitMetrics
{
    double cadenceSPM{0.0};
    double avgStrideLengthM{0.0};
    double walkingSpeedMPS{0.0};
    std::optional<double> symmetryRatio; // min/max of left and right stride length
    std::optional<StepEvent> stepDetected;
};

/// @brief Gait parameters accumulated over the whole session
struct GaitSessionSummary
{
    int stepCount{0};
    std::optional<double> stanceLeftPercent;
    std::optional<double> stanceRightPercent;
    std::optional<double> doubleSupportPercent;
    std::optional<double> strideTimeCVPercent;
    std::optional<double> stepWidthMeanCm;
    std::optional<double> stepWidthSDCm;
    std::optional<double> stepLengthLeftM;
    std::optional<double> stepLengthRightM;
    std::optional<double> stepAsymmetryPercent;
    std::optional<double> footClearanceM;
    std::optional<double> strideLengthM;
};

/// @brief Heel strike detection on the foot joints and the derived spatio-temporal parameters
class GaitAnalyzer
{
private:
    struct FootSample
    {
        double timestamp;
        cv::Point3d position;
    };

    struct FootState
    {
        std::deque<FootSample> window;
        std::optional<FootSample> lastStrike;
        std::optional<FootSample> previousSample;
        std::optional<double> toeOffTime;
        std::optional<double> floorHeight;
        double maxHeightSinceStrike{0.0};
        bool inStance{false};
        std::deque<double> recentStrideLengths;
        std::vector<double> strideTimes;
        std::vector<double> stepLengths;
        int stanceFrames{0};
    };

    static const size_t WINDOW_SIZE = 15;
    static const size_t STRIDE_HISTORY = 50;
    static const size_t SYMMETRY_HISTORY = 20;
    static constexpr double CADENCE_WINDOW_SEC = 10.0;
    static constexpr double SPEED_WINDOW_SEC = 2.0;
    static constexpr double STANCE_HEIGHT_TOLERANCE_M = 0.02;
    static constexpr double STANCE_SPEED_MAX_MPS = 0.3;

    std::array<FootState, 2> feet;
    std::deque<double> strikeTimes;
    std::deque<double> strideLengths;
    std::deque<FootSample> rootHistory;
    std::vector<double> stepWidths;
    std::vector<double> footClearances;
    int frameCount;
    int doubleSupportFrames;
    int stepCount;

    FootState &footState(const Foot foot) { return feet[foot == Foot::Left ? 0 : 1]; }
    const FootState &footState(const Foot foot) const { return feet[foot == Foot::Left ? 0 : 1]; }

    void updateStance(FootState &state, const FootSample &sample);
    std::optional<StepEvent> detectStrike(const Foot foot, const FootSample &sample);
    void completeStep(const Foot foot, const FootSample &strike, const double impactVelocity, StepEvent &step);
    double cadence() const;
    double walkingSpeed() const;
    std::optional<double> symmetryRatio() const;

public:
    GaitAnalyzer();
    ~GaitAnalyzer(){};

    /// @brief Feed one frame
    /// @retval std::nullopt when a foot is occluded, the frame is not counted
    std::optional<GaitMetrics> ProcessFrame(const JointFrame &frame);

    GaitSessionSummary SessionSummary() const;

    void Reset();
};
