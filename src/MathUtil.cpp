/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "MathUtil.hpp"

#include <cmath>
#include <numeric>

double MathUtil::XzDistance(const cv::Point3d &a, const cv::Point3d &b)
{
    const double dx = a.x - b.x;
    const double dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

double MathUtil::AngleFromVerticalDeg(const cv::Point3d &v)
{
    const double length = cv::norm(v);
    if (length <= 0.001) return 0.0;
    const double cosTheta = Clamp(v.y / length, -1.0, 1.0);
    return std::acos(cosTheta) * RAD2DEG;
}

double MathUtil::SagittalAngleFromVerticalDeg(const cv::Point3d &v)
{
    if (std::hypot(v.z, v.y) <= 0.001) return 0.0;
    return std::atan2(v.z, v.y) * RAD2DEG;
}

double MathUtil::FrontalAngleFromVerticalDeg(const cv::Point3d &v)
{
    if (std::hypot(v.x, v.y) <= 0.001) return 0.0;
    return std::atan2(v.x, v.y) * RAD2DEG;
}

double MathUtil::ThreePointAngleDeg(const cv::Point3d &a, const cv::Point3d &vertex, const cv::Point3d &c)
{
    const cv::Point3d ba = a - vertex;
    const cv::Point3d bc = c - vertex;
    const double lengths = cv::norm(ba) * cv::norm(bc);
    if (lengths <= 1e-9) return 0.0;
    const double cosTheta = Clamp(ba.dot(bc) / lengths, -1.0, 1.0);
    return std::acos(cosTheta) * RAD2DEG;
}

double MathUtil::SignedAngle2DDeg(const cv::Point2d &a, const cv::Point2d &b)
{
    const double cross = a.x * b.y - a.y * b.x;
    return std::atan2(cross, a.dot(b)) * RAD2DEG;
}

double MathUtil::PointToLineDistance(const cv::Point3d &point, const cv::Point3d &lineStart, const cv::Point3d &lineEnd)
{
    const cv::Point3d lineDir = lineEnd - lineStart;
    const double length = cv::norm(lineDir);
    if (length <= 0.001) return cv::norm(point - lineStart);

    const double t = Clamp((point - lineStart).dot(lineDir) / (length * length), 0.0, 1.0);
    const cv::Point3d projection = lineStart + t * lineDir;
    return cv::norm(point - projection);
}

double MathUtil::Mean(const std::vector<double> &values)
{
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double MathUtil::StandardDeviation(const std::vector<double> &values)
{
    if (values.size() < 2) return 0.0;

    const double mean = Mean(values);
    double squareSum = 0.0;
    for (const double value : values)
    {
        squareSum += (value - mean) * (value - mean);
    }
    return std::sqrt(squareSum / (values.size() - 1.0));
}

double MathUtil::CoefficientOfVariationPercent(const std::vector<double> &values)
{
    const double mean = Mean(values);
    if (std::abs(mean) < 1e-9) return 0.0;
    return StandardDeviation(values) / mean * 100.0;
}

std::optional<double> MathUtil::RobinsonSymmetryIndex(const double left, const double right)
{
    const double mean = 0.5 * (left + right);
    if (mean <= 0.1) return std::nullopt;
    return std::abs(left - right) / mean * 100.0;
}

LinearFit MathUtil::LinearRegression(const std::vector<double> &ys)
{
    LinearFit fit;
    if (ys.size() < 2)
    {
        fit.intercept = ys.empty() ? 0.0 : ys.front();
        return fit;
    }

    const double n = static_cast<double>(ys.size());
    double sumX = 0.0, sumY = 0.0, sumXY = 0.0, sumX2 = 0.0;
    for (size_t i = 0; i < ys.size(); i++)
    {
        const double x = static_cast<double>(i);
        sumX += x;
        sumY += ys[i];
        sumXY += x * ys[i];
        sumX2 += x * x;
    }

    const double denominator = n * sumX2 - sumX * sumX;
    if (std::abs(denominator) <= 1e-12)
    {
        fit.intercept = sumY / n;
        return fit;
    }

    fit.slope = (n * sumXY - sumX * sumY) / denominator;
    fit.intercept = (sumY - fit.slope * sumX) / n;

    const double meanY = sumY / n;
    double ssTotal = 0.0, ssResidual = 0.0;
    for (size_t i = 0; i < ys.size(); i++)
    {
        const double predicted = fit.slope * i + fit.intercept;
        ssTotal += (ys[i] - meanY) * (ys[i] - meanY);
        ssResidual += (ys[i] - predicted) * (ys[i] - predicted);
    }
    fit.rSquared = ssTotal > 1e-12 ? 1.0 - ssResidual / ssTotal : 0.0;
    return fit;
}
