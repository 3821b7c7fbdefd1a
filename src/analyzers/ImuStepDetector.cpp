/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "ImuStepDetector.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/core.hpp>

#include "MathUtil.hpp"

ImuStepDetector::ImuStepDetector(const double samplingRateHz)
{
    const double omega = 2.0 * CV_PI * CUTOFF_HZ / samplingRateHz;
    const double cosOmega = std::cos(omega);
    const double alpha = std::sin(omega) / (2.0 * std::sqrt(2.0));
    const double a0 = 1.0 + alpha;

    coefficients.a1 = -2.0 * cosOmega / a0;
    coefficients.a2 = (1.0 - alpha) / a0;
    coefficients.b0 = (1.0 - cosOmega) / 2.0 / a0;
    coefficients.b1 = (1.0 - cosOmega) / a0;
    coefficients.b2 = coefficients.b0;

    Reset();
}

void ImuStepDetector::Reset()
{
    x1 = x2 = y1 = y2 = 0.0;
    samples.clear();
    peakMagnitudes.clear();
    stepTimestamps.clear();
    lastStepTime.reset();
    stepCount = 0;
}

double ImuStepDetector::applyFilter(const double x)
{
    const double y = coefficients.b0 * x + coefficients.b1 * x1 + coefficients.b2 * x2 - coefficients.a1 * y1 -
                     coefficients.a2 * y2;
    x2 = x1;
    x1 = x;
    y2 = y1;
    y1 = y;
    return y;
}

/// @brief max(0.08, mean - 1.2 SD) of the recent peaks, population SD
double ImuStepDetector::adaptiveThreshold() const
{
    if (peakMagnitudes.empty()) return MIN_PEAK_G;

    double sum = 0.0;
    for (const double peak : peakMagnitudes) sum += peak;
    const double mean = sum / peakMagnitudes.size();

    double variance = 0.0;
    for (const double peak : peakMagnitudes) variance += (peak - mean) * (peak - mean);
    variance /= peakMagnitudes.size();

    return std::max(MIN_PEAK_G, mean - THRESHOLD_K * std::sqrt(variance));
}

double ImuStepDetector::cadence() const
{
    if (stepTimestamps.size() < 2) return 0.0;

    const double last = stepTimestamps.back();
    size_t count = 0;
    double first = last;
    for (const double t : stepTimestamps)
    {
        if (t < last - CADENCE_WINDOW_SEC) continue;
        if (count == 0) first = t;
        count++;
    }
    const double duration = last - first;
    if (count < 2 || duration <= 0.3) return 0.0;
    return (count - 1) / duration * 60.0;
}

std::optional<ImuStepEvent> ImuStepDetector::ProcessSample(const double timestamp, const double verticalAccelerationG)
{
    samples.push_back({timestamp, applyFilter(std::abs(verticalAccelerationG))});
    if (samples.size() > MAX_SAMPLES) samples.pop_front();
    if (samples.size() < 3) return std::nullopt;

    const size_t n = samples.size();
    const double previous = samples[n - 3].filtered;
    const double candidate = samples[n - 2].filtered;
    const double current = samples[n - 1].filtered;
    const double candidateTime = samples[n - 2].timestamp;

    if (!(candidate > previous && candidate > current)) return std::nullopt;
    if (candidate <= MIN_PEAK_G) return std::nullopt;
    if (candidate < adaptiveThreshold()) return std::nullopt;
    if (lastStepTime && candidateTime - *lastStepTime < REFRACTORY_SEC) return std::nullopt;

    lastStepTime = candidateTime;
    stepCount++;
    stepTimestamps.push_back(candidateTime);
    if (stepTimestamps.size() > MAX_STEP_HISTORY) stepTimestamps.pop_front();
    peakMagnitudes.push_back(candidate);
    if (peakMagnitudes.size() > THRESHOLD_WINDOW) peakMagnitudes.pop_front();

    return ImuStepEvent{candidateTime, cadence(), candidate};
}

double ImuStepDetector::ValidateStep(const double timestamp) const
{
    bool found = false;
    double best = 0.0;
    for (const FilteredSample &sample : samples)
    {
        if (std::abs(sample.timestamp - timestamp) > VALIDATION_WINDOW_SEC) continue;
        best = found ? std::max(best, sample.filtered) : sample.filtered;
        found = true;
    }
    if (!found) return 0.0;

    const double threshold = adaptiveThreshold();
    if (threshold <= 0.0) return 0.5;
    return MathUtil::Clamp((best / threshold - 0.5) * 2.0, 0.0, 1.0);
}
