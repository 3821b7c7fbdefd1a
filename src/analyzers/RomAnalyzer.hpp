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
#include <vector>

#include "Types.hpp"

/// @brief Joint angles of one frame. A value is absent when one of its joints is occluded.
struct RomMetrics
{
    std::optional<double> hipFlexionLeftDeg;
    std::optional<double> hipFlexionRightDeg;
    std::optional<double> kneeFlexionLeftDeg;
    std::optional<double> kneeFlexionRightDeg;
    std::optional<double> pelvicTiltDeg;
    std::optional<double> trunkRotationDeg;
    std::optional<double> armSwingLeftDeg;
    std::optional<double> armSwingRightDeg;

    bool HasSignificantAsymmetry() const;

    /// @brief Fills the angles absent here from an earlier frame
    void FillMissing(const RomMetrics &previous);
};

/// @brief Range (max - min) of each angle over the session
struct RomSessionSummary
{
    double hipRomLeftDeg{0.0};
    double hipRomRightDeg{0.0};
    double kneeRomLeftDeg{0.0};
    double kneeRomRightDeg{0.0};
    double trunkRotationRangeDeg{0.0};
    double pelvicTiltRangeDeg{0.0};
    double armSwingLeftRangeDeg{0.0};
    double armSwingRightRangeDeg{0.0};
    double armSwingAsymmetryPercent{0.0};

    double HipRomDeg() const { return 0.5 * (hipRomLeftDeg + hipRomRightDeg); }
    double KneeRomDeg() const { return 0.5 * (kneeRomLeftDeg + kneeRomRightDeg); }
};

class RomAnalyzer
{
private:
    std::vector<double> hipFlexLeftHistory;
    std::vector<double> hipFlexRightHistory;
    std::vector<double> kneeFlexLeftHistory;
    std::vector<double> kneeFlexRightHistory;
    std::vector<double> trunkRotationHistory;
    std::vector<double> pelvicTiltHistory;
    std::vector<double> armSwingLeftHistory;
    std::vector<double> armSwingRightHistory;

    static std::optional<double> hipFlexion(const JointFrame &frame, const JointName hip, const JointName knee);
    static std::optional<double> kneeFlexion(const JointFrame &frame, const JointName hip, const JointName knee,
                                             const JointName ankle);
    static std::optional<double> armSwing(const JointFrame &frame, const JointName shoulder, const JointName elbow);
    static double range(const std::vector<double> &values);

public:
    RomAnalyzer(){};
    ~RomAnalyzer(){};

    RomMetrics Analyze(const JointFrame &frame) const;

    /// @brief Add the measured angles to the session histories
    void RecordFrame(const RomMetrics &metrics);

    RomSessionSummary SessionSummary() const;

    void Reset();
};
