/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "BalanceAnalyzer.hpp"

#include <cmath>

#include "MathUtil.hpp"

BalanceAnalyzer::BalanceAnalyzer() { Reset(); }

void BalanceAnalyzer::Reset()
{
    positions.clear();
    eyesOpenPositions.clear();
    eyesClosedPositions.clear();
    rombergPhase = RombergPhase::None;
    isStanding = false;
}

BalanceMetrics BalanceAnalyzer::ProcessFrame(const cv::Point3d &rootPosition, const double timestamp)
{
    const TimedPosition timed{timestamp, rootPosition};
    positions.push_back(timed);
    while (timestamp - positions.front().timestamp > SWAY_WINDOW_SEC) positions.pop_front();

    if (rombergPhase == RombergPhase::EyesOpen) eyesOpenPositions.push_back(timed);
    if (rombergPhase == RombergPhase::EyesClosed) eyesClosedPositions.push_back(timed);

    updateStandingState();

    if (positions.size() < MIN_SAMPLES) return BalanceMetrics();
    return computeMetrics(std::vector<TimedPosition>(positions.begin(), positions.end()));
}

void BalanceAnalyzer::StartRombergEyesOpen()
{
    rombergPhase = RombergPhase::EyesOpen;
    eyesOpenPositions.clear();
    eyesClosedPositions.clear();
}

void BalanceAnalyzer::StartRombergEyesClosed()
{
    rombergPhase = RombergPhase::EyesClosed;
    eyesClosedPositions.clear();
}

std::optional<RombergResult> BalanceAnalyzer::CompleteRomberg()
{
    rombergPhase = RombergPhase::None;
    if (eyesOpenPositions.size() < MIN_SAMPLES || eyesClosedPositions.size() < MIN_SAMPLES) return std::nullopt;

    const BalanceMetrics eyesOpen = computeMetrics(eyesOpenPositions);
    const BalanceMetrics eyesClosed = computeMetrics(eyesClosedPositions);

    RombergResult result;
    result.eyesOpenSwayVelocity = eyesOpen.swayVelocityMMS;
    result.eyesClosedSwayVelocity = eyesClosed.swayVelocityMMS;
    result.velocityRatio = eyesOpen.swayVelocityMMS > 0.1 ? eyesClosed.swayVelocityMMS / eyesOpen.swayVelocityMMS : 1.0;
    result.areaRatio = eyesOpen.swayAreaCm2 > 0.01 ? eyesClosed.swayAreaCm2 / eyesOpen.swayAreaCm2 : 1.0;
    return result;
}

void BalanceAnalyzer::updateStandingState()
{
    isStanding = false;
    if (positions.size() < 10) return;

    const size_t firstIndex = positions.size() > STANDING_WINDOW ? positions.size() - STANDING_WINDOW : 0;
    const TimedPosition &first = positions[firstIndex];
    const TimedPosition &last = positions.back();
    const double dt = last.timestamp - first.timestamp;
    if (dt <= 0.5) return;

    isStanding = MathUtil::XzDistance(first.position, last.position) / dt < STANDING_SPEED_MPS;
}

BalanceMetrics BalanceAnalyzer::computeMetrics(const std::vector<TimedPosition> &samples)
{
    BalanceMetrics metrics;
    if (samples.size() < 2) return metrics;

    // columns: x (mediolateral), z (anteroposterior) in millimetres
    cv::Mat xz(static_cast<int>(samples.size()), 2, CV_64F);
    for (size_t i = 0; i < samples.size(); i++)
    {
        xz.at<double>(static_cast<int>(i), 0) = samples[i].position.x * 1000.0;
        xz.at<double>(static_cast<int>(i), 1) = samples[i].position.z * 1000.0;
    }

    cv::Mat centroid;
    cv::reduce(xz, centroid, 0, cv::REDUCE_AVG);
    const cv::Mat centered = xz - cv::repeat(centroid, xz.rows, 1);

    double minX, maxX, minZ, maxZ;
    cv::minMaxLoc(centered.col(0), &minX, &maxX);
    cv::minMaxLoc(centered.col(1), &minZ, &maxZ);
    metrics.apRangeMM = maxZ - minZ;
    metrics.mlRangeMM = maxX - minX;
    metrics.apMlRatio = metrics.mlRangeMM > 0.1 ? metrics.apRangeMM / metrics.mlRangeMM : 1.0;

    double distanceSum = 0.0;
    double pathLength = 0.0;
    for (int i = 0; i < centered.rows; i++)
    {
        distanceSum += std::hypot(centered.at<double>(i, 0), centered.at<double>(i, 1));
        if (i > 0)
        {
            pathLength += std::hypot(xz.at<double>(i, 0) - xz.at<double>(i - 1, 0),
                                     xz.at<double>(i, 1) - xz.at<double>(i - 1, 1));
        }
    }
    metrics.meanSwayDistanceMM = distanceSum / centered.rows;

    const double totalTime = samples.back().timestamp - samples.front().timestamp;
    metrics.swayVelocityMMS = totalTime > 0.0 ? pathLength / totalTime : 0.0;
    metrics.swayAreaCm2 = ellipseArea95(centered) / 100.0;
    return metrics;
}

/// @brief Area of the 95% confidence ellipse [mm^2] from the sample covariance (n-1)
double BalanceAnalyzer::ellipseArea95(const cv::Mat &centered)
{
    if (centered.rows < 3) return 0.0;

    const cv::Mat covariance = centered.t() * centered / (centered.rows - 1.0);
    cv::Mat eigenvalues;
    cv::eigen(covariance, eigenvalues);

    const double lambda1 = eigenvalues.at<double>(0);
    const double lambda2 = eigenvalues.at<double>(1);
    if (lambda1 <= 0.0 || lambda2 <= 0.0) return 0.0;

    const double chiSquare95 = 5.991;
    return CV_PI * chiSquare95 * std::sqrt(lambda1 * lambda2);
}
