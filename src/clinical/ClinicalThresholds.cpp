/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "ClinicalThresholds.hpp"

#include <cmath>

#include "MathUtil.hpp"

namespace
{
    /// @brief Ladder for values where a larger magnitude is worse
    Severity absoluteLadder(const double value, const double normalMax, const double mildMax, const double moderateMax)
    {
        const double magnitude = std::abs(value);
        if (magnitude <= normalMax) return Severity::Normal;
        if (magnitude <= mildMax) return Severity::Mild;
        if (magnitude <= moderateMax) return Severity::Moderate;
        return Severity::Severe;
    }

    /// @brief Ladder for a normal band with symmetric tolerance outside of it
    Severity bandLadder(const double value, const double low, const double high, const double mildTolerance,
                        const double moderateTolerance)
    {
        if (value >= low && value <= high) return Severity::Normal;
        const double deviation = value < low ? low - value : value - high;
        if (deviation <= mildTolerance) return Severity::Mild;
        if (deviation <= moderateTolerance) return Severity::Moderate;
        return Severity::Severe;
    }
}

Severity PostureThresholds::CvaSeverity(const double angleDeg)
{
    if (angleDeg >= 49.0) return Severity::Normal;
    if (angleDeg >= 40.0) return Severity::Mild;
    if (angleDeg >= 30.0) return Severity::Moderate;
    return Severity::Severe;
}

Severity PostureThresholds::SvaSeverity(const double cm)
{
    // strict upper bounds, unlike the other posture ladders
    const double magnitude = std::abs(cm);
    if (magnitude < 5.0) return Severity::Normal;
    if (magnitude < 7.0) return Severity::Mild;
    if (magnitude < 9.5) return Severity::Moderate;
    return Severity::Severe;
}

Severity PostureThresholds::TrunkForwardSeverity(const double deg) { return absoluteLadder(deg, 5.0, 10.0, 20.0); }

Severity PostureThresholds::LateralLeanSeverity(const double deg) { return absoluteLadder(deg, 2.0, 5.0, 10.0); }

Severity PostureThresholds::ShoulderSeverity(const double cm) { return absoluteLadder(cm, 1.5, 3.0, 5.0); }

Severity PostureThresholds::PelvicSeverity(const double deg) { return absoluteLadder(deg, 1.0, 3.0, 5.0); }

Severity PostureThresholds::KyphosisSeverity(const double deg)
{
    if (deg >= 20.0 && deg <= 45.0) return Severity::Normal;
    if (deg < 20.0) return deg < 10.0 ? Severity::Moderate : Severity::Mild; // hypokyphosis
    if (deg <= 55.0) return Severity::Mild;
    if (deg <= 70.0) return Severity::Moderate;
    return Severity::Severe;
}

Severity PostureThresholds::LordosisSeverity(const double deg)
{
    if (deg >= 40.0 && deg <= 60.0) return Severity::Normal;
    if ((deg >= 25.0 && deg <= 40.0) || (deg >= 60.0 && deg <= 70.0)) return Severity::Mild;
    if ((deg >= 20.0 && deg <= 25.0) || (deg >= 70.0 && deg <= 80.0)) return Severity::Moderate;
    return Severity::Severe;
}

Severity PostureThresholds::ScoliosisSeverity(const double cm) { return absoluteLadder(cm, 1.0, 2.0, 3.5); }

double PostureThresholds::SubScore(const double measured, const double ideal, const double maxDeviation)
{
    if (maxDeviation <= 0.0) return 100.0;
    return MathUtil::Clamp(100.0 * (1.0 - std::abs(measured - ideal) / maxDeviation), 0.0, 100.0);
}

Severity GaitThresholds::SpeedSeverity(const double mps)
{
    if (mps >= 1.0) return Severity::Normal;
    if (mps >= 0.8) return Severity::Mild;
    if (mps >= 0.6) return Severity::Moderate;
    return Severity::Severe;
}

Severity GaitThresholds::CadenceSeverity(const double spm)
{
    return bandLadder(spm, CADENCE_NORMAL_MIN, CADENCE_NORMAL_MAX, 10.0, 20.0);
}

Severity GaitThresholds::SymmetrySeverity(const double percent) { return absoluteLadder(percent, 10.0, 15.0, 25.0); }

Severity GaitThresholds::StepWidthSeverity(const double cm)
{
    return bandLadder(cm, STEP_WIDTH_NORMAL_MIN, STEP_WIDTH_NORMAL_MAX, 2.0, 5.0);
}
