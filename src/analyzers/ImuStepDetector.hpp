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

struct ImuStepEvent
{
    double timestamp;
    double instantCadenceSPM;
    double impactMagnitudeG;
};

/// @brief Step detection on the vertical user acceleration.
///
/// The signal is low-pass filtered (2nd order Butterworth, 5 Hz) and a step is a
/// local maximum, confirmed one sample later, above an adaptive threshold and
/// outside the 250 ms refractory period.
class ImuStepDetector
{
private:
    struct FilteredSample
    {
        double timestamp;
        double filtered;
    };

    struct BiquadCoefficients
    {
        double a1;
        double a2;
        double b0;
        double b1;
        double b2;
    };

    static constexpr double CUTOFF_HZ = 5.0;
    static constexpr double REFRACTORY_SEC = 0.25;
    static constexpr double MIN_PEAK_G = 0.08;
    static constexpr double THRESHOLD_K = 1.2;
    static constexpr double VALIDATION_WINDOW_SEC = 0.10;
    static constexpr double CADENCE_WINDOW_SEC = 10.0;
    static const size_t THRESHOLD_WINDOW = 50;
    static const size_t MAX_SAMPLES = 300;
    static const size_t MAX_STEP_HISTORY = 100;

    BiquadCoefficients coefficients;
    double x1, x2, y1, y2;

    std::deque<FilteredSample> samples;
    std::deque<double> peakMagnitudes;
    std::deque<double> stepTimestamps;
    std::optional<double> lastStepTime;
    int stepCount;

    double applyFilter(const double x);
    double adaptiveThreshold() const;
    double cadence() const;

public:
    explicit ImuStepDetector(const double samplingRateHz = 60.0);
    ~ImuStepDetector(){};

    /// @param verticalAccelerationG user acceleration on the vertical axis, gravity removed
    std::optional<ImuStepEvent> ProcessSample(const double timestamp, const double verticalAccelerationG);

    /// @brief Confidence in [0, 1] that a skeleton foot strike at the timestamp is a real step
    /// @retval 0 when no filtered sample lies within +-100 ms
    double ValidateStep(const double timestamp) const;

    double CadenceSPM() const { return cadence(); }
    int StepCount() const { return stepCount; }

    void Reset();
};
