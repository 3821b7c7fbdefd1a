/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include "clinical/Severity.hpp"

/// @brief One factor of a weighted composite score
struct CompositeFactor
{
    double ideal;
    double maxDeviation;
    double weight;
};

/// @brief Posture severity ladders and composite weights
namespace PostureThresholds
{
    // Craniovertebral angle [deg], lower is worse
    Severity CvaSeverity(const double angleDeg);
    // Sagittal vertical axis [cm], absolute value
    Severity SvaSeverity(const double cm);
    Severity TrunkForwardSeverity(const double deg);
    Severity LateralLeanSeverity(const double deg);
    Severity ShoulderSeverity(const double cm);
    Severity PelvicSeverity(const double deg);
    Severity KyphosisSeverity(const double deg);
    Severity LordosisSeverity(const double deg);
    Severity ScoliosisSeverity(const double cm);

    // composite posture factors, weights sum to 1.0
    constexpr CompositeFactor CVA{52.0, 20.0, 0.22};
    constexpr CompositeFactor SVA{0.0, 8.0, 0.22};
    constexpr CompositeFactor TRUNK{0.0, 15.0, 0.13};
    constexpr CompositeFactor LATERAL{0.0, 10.0, 0.08};
    constexpr CompositeFactor SHOULDER{0.0, 5.0, 0.08};
    constexpr CompositeFactor KYPHOSIS{35.0, 25.0, 0.10};
    constexpr CompositeFactor PELVIC{0.0, 8.0, 0.05};
    constexpr CompositeFactor LORDOSIS{45.0, 25.0, 0.07};
    constexpr CompositeFactor CORONAL{0.0, 4.0, 0.05};

    /// @brief clamp(100 * (1 - |measured - ideal| / maxDeviation), 0, 100). Returns 100 when maxDeviation <= 0.
    double SubScore(const double measured, const double ideal, const double maxDeviation);

    constexpr int NYPR_ITEM_POINTS = 5;
    constexpr int NYPR_ITEM_COUNT = 9;
}

/// @brief Gait severity ladders and fall-risk reference values
namespace GaitThresholds
{
    Severity SpeedSeverity(const double mps);
    Severity CadenceSeverity(const double spm);
    Severity SymmetrySeverity(const double percent);
    Severity StepWidthSeverity(const double cm);

    constexpr double SPEED_FRAILTY = 0.8;
    constexpr double CADENCE_NORMAL_MIN = 100.0;
    constexpr double CADENCE_NORMAL_MAX = 130.0;
    constexpr double DOUBLE_SUPPORT_FALL_RISK = 30.0;
    constexpr double STEP_WIDTH_NORMAL_MIN = 5.0;
    constexpr double STEP_WIDTH_NORMAL_MAX = 13.0;
    constexpr double STEP_WIDTH_VARIABILITY_FALL_RISK = 2.5;
    constexpr double STRIDE_TIME_CV_FALL_RISK = 5.0;
    constexpr double SYMMETRY_NORMAL_MAX = 10.0;
    constexpr double TUG_FALL_RISK = 13.5;
    constexpr double FOOT_CLEARANCE_MIN = 0.02;
    constexpr double ARM_SWING_ASYMMETRY_NORMAL_MAX = 10.0;
    constexpr double WALK_RATIO_NORMAL = 0.0064;
}

namespace RomThresholds
{
    constexpr double HIP_FLEXION_NORMAL_MIN = 30.0;
    constexpr double HIP_FLEXION_NORMAL_MAX = 40.0;
    constexpr double KNEE_SWING_NORMAL_MIN = 60.0;
    constexpr double KNEE_SWING_NORMAL_MAX = 70.0;
    constexpr double ASYMMETRY_DEG = 5.0;
}

namespace BalanceThresholds
{
    constexpr double SWAY_VELOCITY_FALL_RISK = 25.0; // mm/s
    constexpr double SWAY_AREA_FALL_RISK = 5.0;      // cm^2
    constexpr double ROMBERG_RATIO_NORMAL_MAX = 2.0;
}
