/*
 * (c) 2022 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <opencv2/core.hpp>

#include <algorithm>
#include <optional>
#include <vector>

/// @brief Result of an ordinary least squares fit against the sample index
struct LinearFit
{
    double slope{0.0};
    double intercept{0.0};
    double rSquared{0.0};
};

/// @brief Math utilities
namespace MathUtil
{
    template <class T> inline T Clamp(T value, T min, T max) { return std::max(min, std::min(value, max)); }

    constexpr double RAD2DEG = 57.29577951308232;

    // --- geometry (metres, y up, z anterior, x right) ---

    /// @brief Horizontal distance in the xz plane
    double XzDistance(const cv::Point3d &a, const cv::Point3d &b);

    /// @brief Unsigned angle between the vector and the global up axis [deg]
    double AngleFromVerticalDeg(const cv::Point3d &v);

    /// @brief Signed angle from vertical after projection on the sagittal (z, y) plane. Positive is forward.
    double SagittalAngleFromVerticalDeg(const cv::Point3d &v);

    /// @brief Signed angle from vertical after projection on the frontal (x, y) plane. Positive is to the right.
    double FrontalAngleFromVerticalDeg(const cv::Point3d &v);

    /// @brief Angle at vertex formed by rays vertex->a and vertex->c [deg, 0-180]
    double ThreePointAngleDeg(const cv::Point3d &a, const cv::Point3d &vertex, const cv::Point3d &c);

    /// @brief Signed angle from a to b using the cross product for the sign [deg]
    double SignedAngle2DDeg(const cv::Point2d &a, const cv::Point2d &b);

    /// @brief Perpendicular distance from a point to the segment [lineStart, lineEnd]
    double PointToLineDistance(const cv::Point3d &point, const cv::Point3d &lineStart, const cv::Point3d &lineEnd);

    // --- statistics ---

    double Mean(const std::vector<double> &values);

    /// @brief Bessel corrected standard deviation. Returns 0 for fewer than two samples.
    double StandardDeviation(const std::vector<double> &values);

    /// @brief Coefficient of variation in percent. Returns 0 when the mean is near zero.
    double CoefficientOfVariationPercent(const std::vector<double> &values);

    /// @brief Robinson symmetry index |L-R| / (0.5 (L+R)) * 100
    std::optional<double> RobinsonSymmetryIndex(const double left, const double right);

    LinearFit LinearRegression(const std::vector<double> &ys);
}
