/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <deque>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

/// @brief Postural sway of the root joint projected on the floor
struct BalanceMetrics
{
    double swayVelocityMMS{0.0};
    double swayAreaCm2{0.0}; // 95% confidence ellipse
    double apRangeMM{0.0};
    double mlRangeMM{0.0};
    double apMlRatio{1.0};
    double meanSwayDistanceMM{0.0};
};

struct RombergResult
{
    double eyesOpenSwayVelocity;
    double eyesClosedSwayVelocity;
    double velocityRatio;
    double areaRatio;
};

/// @brief Sway analysis over a sliding 5 s window, with an optional Romberg protocol
class BalanceAnalyzer
{
private:
    struct TimedPosition
    {
        double timestamp;
        cv::Point3d position;
    };

    enum class RombergPhase
    {
        None,
        EyesOpen,
        EyesClosed,
    };

    static constexpr double SWAY_WINDOW_SEC = 5.0;
    static const size_t MIN_SAMPLES = 15;
    static const size_t STANDING_WINDOW = 45;
    static constexpr double STANDING_SPEED_MPS = 0.15;

    std::deque<TimedPosition> positions;
    std::vector<TimedPosition> eyesOpenPositions;
    std::vector<TimedPosition> eyesClosedPositions;
    RombergPhase rombergPhase;
    bool isStanding;

    void updateStandingState();
    static BalanceMetrics computeMetrics(const std::vector<TimedPosition> &samples);
    static double ellipseArea95(const cv::Mat &centered);

public:
    BalanceAnalyzer();
    ~BalanceAnalyzer(){};

    /// @brief Returns zero metrics (ratio 1) until the window holds 15 samples
    BalanceMetrics ProcessFrame(const cv::Point3d &rootPosition, const double timestamp);

    bool IsStanding() const { return isStanding; }

    void StartRombergEyesOpen();
    void StartRombergEyesClosed();

    /// @retval std::nullopt when one of the two recordings is shorter than 15 samples
    std::optional<RombergResult> CompleteRomberg();

    void Reset();
};
