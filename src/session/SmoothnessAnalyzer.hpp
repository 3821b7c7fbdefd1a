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
#include <vector>

#include <opencv2/core.hpp>

struct SmoothnessMetrics
{
    double sparcScore{0.0};      // more negative is less smooth
    double harmonicRatioAP{0.0}; // even / odd
    double harmonicRatioML{0.0}; // odd / even
    double normalizedJerk{0.0};
};

/// @brief Movement smoothness of the trunk acceleration: SPARC, harmonic ratios and normalized jerk
class SmoothnessAnalyzer
{
private:
    struct AccelerationSample
    {
        double timestamp;
        double ap;
        double ml;
        double v;
    };

    static const size_t MIN_SAMPLES = 128;
    static const size_t MAX_SAMPLES = 36000;
    static const int NUM_HARMONICS = 20;

    std::deque<AccelerationSample> samples;

    static cv::Mat spectrum(const std::vector<double> &signal, const int length);
    static double computeSparc(const std::vector<double> &signal, const double fs);
    static double computeHarmonicRatio(const std::vector<double> &signal, const double fs, const bool isMediolateral);
    static double strideFundamental(const cv::Mat &dft, const int n, const double fs);
    static double computeNormalizedJerk(const std::vector<double> &signal, const double fs, const double duration);

public:
    SmoothnessAnalyzer(){};
    ~SmoothnessAnalyzer(){};

    /// @brief Accelerations in g. AP is anterior (z), ML is lateral (x), V is vertical (y).
    void RecordSample(const double timestamp, const double ap, const double ml, const double v);

    /// @brief All zero below 128 samples or 0.5 s of data
    SmoothnessMetrics Analyze() const;

    size_t SampleCount() const { return samples.size(); }
    bool HasEnoughSamples() const { return samples.size() >= MIN_SAMPLES; }

    void Reset() { samples.clear(); }
};
