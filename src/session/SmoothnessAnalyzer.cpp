/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SmoothnessAnalyzer.hpp"

#include <algorithm>
#include <cmath>

namespace
{
    int nextPowerOfTwo(const int n)
    {
        int p = 1;
        while (p < n) p *= 2;
        return p;
    }

    double binMagnitude(const cv::Mat &dft, const int k)
    {
        const cv::Vec2d bin = dft.at<cv::Vec2d>(0, k);
        return std::hypot(bin[0], bin[1]);
    }
}

void SmoothnessAnalyzer::RecordSample(const double timestamp, const double ap, const double ml, const double v)
{
    samples.push_back({timestamp, ap, ml, v});
    if (samples.size() > MAX_SAMPLES) samples.pop_front();
}

SmoothnessMetrics SmoothnessAnalyzer::Analyze() const
{
    SmoothnessMetrics metrics;
    if (samples.size() < MIN_SAMPLES) return metrics;

    const double totalTime = samples.back().timestamp - samples.front().timestamp;
    if (totalTime <= 0.5) return metrics;
    const double fs = samples.size() / totalTime;

    std::vector<double> magnitudes, ap, ml;
    magnitudes.reserve(samples.size());
    ap.reserve(samples.size());
    ml.reserve(samples.size());
    for (const AccelerationSample &sample : samples)
    {
        magnitudes.push_back(std::sqrt(sample.ap * sample.ap + sample.ml * sample.ml + sample.v * sample.v));
        ap.push_back(sample.ap);
        ml.push_back(sample.ml);
    }

    metrics.sparcScore = computeSparc(magnitudes, fs);
    metrics.harmonicRatioAP = computeHarmonicRatio(ap, fs, false);
    metrics.harmonicRatioML = computeHarmonicRatio(ml, fs, true);
    metrics.normalizedJerk = computeNormalizedJerk(magnitudes, fs, totalTime);
    return metrics;
}

/// @brief Complex DFT (1 x length, CV_64FC2) of the signal zero padded to length
cv::Mat SmoothnessAnalyzer::spectrum(const std::vector<double> &signal, const int length)
{
    cv::Mat padded = cv::Mat::zeros(1, length, CV_64F);
    for (int i = 0; i < std::min<int>(length, static_cast<int>(signal.size())); i++) padded.at<double>(0, i) = signal[i];

    cv::Mat dft;
    cv::dft(padded, dft, cv::DFT_COMPLEX_OUTPUT);
    return dft;
}

/// @brief Negative arc length of the normalized magnitude spectrum up to min(20 Hz, fs / 2)
double SmoothnessAnalyzer::computeSparc(const std::vector<double> &signal, const double fs)
{
    const int n = static_cast<int>(signal.size());
    if (n < 4) return 0.0;

    const int nfft = nextPowerOfTwo(n);
    const double resolution = fs / nfft;
    const double maxFrequency = std::min(20.0, fs / 2.0);
    const int maxBin = static_cast<int>(maxFrequency / resolution);
    const int binCount = std::min(maxBin + 1, nfft / 2);
    if (binCount < 2) return 0.0;

    const cv::Mat dft = spectrum(signal, nfft);
    std::vector<double> magnitudes(binCount);
    for (int k = 0; k < binCount; k++) magnitudes[k] = binMagnitude(dft, k) / nfft;

    const double maxMagnitude = *std::max_element(magnitudes.begin(), magnitudes.end());
    if (maxMagnitude <= 1e-10) return 0.0;

    const double dfNorm = maxFrequency > 0.0 ? resolution / maxFrequency : 1.0;
    double arcLength = 0.0;
    for (int k = 1; k < binCount; k++)
    {
        const double dMagnitude = (magnitudes[k] - magnitudes[k - 1]) / maxMagnitude;
        arcLength += std::sqrt(dfNorm * dfNorm + dMagnitude * dMagnitude);
    }
    return -arcLength;
}

/// @brief Frequency of the strongest bin in 0.7-1.3 Hz, 1 Hz when the band holds no bin
double SmoothnessAnalyzer::strideFundamental(const cv::Mat &dft, const int n, const double fs)
{
    const double binSize = fs / n;
    const int minBin = std::max(1, static_cast<int>(0.7 / binSize));
    const int maxBin = std::min(n / 2 - 1, static_cast<int>(1.3 / binSize));
    if (minBin >= maxBin) return 1.0;

    int peakBin = static_cast<int>(1.0 / binSize);
    double maxPower = 0.0;
    for (int k = minBin; k <= maxBin; k++)
    {
        const double power = std::pow(binMagnitude(dft, k), 2.0);
        if (power > maxPower)
        {
            maxPower = power;
            peakBin = k;
        }
    }
    return peakBin * binSize;
}

double SmoothnessAnalyzer::computeHarmonicRatio(const std::vector<double> &signal, const double fs,
                                                const bool isMediolateral)
{
    const int n = static_cast<int>(signal.size());
    if (n < 4) return 0.0;

    const cv::Mat dft = spectrum(signal, n);
    const double fundamental = strideFundamental(dft, n, fs);
    const double binSize = fs / n;

    double evenSum = 0.0;
    double oddSum = 0.0;
    for (int h = 1; h <= NUM_HARMONICS; h++)
    {
        const int k = static_cast<int>(std::round(fundamental * h / binSize));
        if (k >= n / 2) break;

        const double magnitude = binMagnitude(dft, k) / n;
        if (h % 2 == 0)
            evenSum += magnitude;
        else
            oddSum += magnitude;
    }

    // a symmetric gait shows even harmonics in AP and odd harmonics in ML
    if (isMediolateral) return evenSum > 1e-10 ? oddSum / evenSum : 0.0;
    return oddSum > 1e-10 ? evenSum / oddSum : 0.0;
}

/// @brief sqrt(mean squared jerk) * T^1.5 / peak-to-peak amplitude, central differences
double SmoothnessAnalyzer::computeNormalizedJerk(const std::vector<double> &signal, const double fs,
                                                 const double duration)
{
    if (signal.size() < 3 || duration <= 0.0 || fs <= 0.0) return 0.0;

    const double dt = 1.0 / fs;
    double jerkSquareSum = 0.0;
    for (size_t i = 1; i + 1 < signal.size(); i++)
    {
        const double jerk = (signal[i + 1] - signal[i - 1]) / (2.0 * dt);
        jerkSquareSum += jerk * jerk;
    }

    const auto minMax = std::minmax_element(signal.begin(), signal.end());
    const double amplitude = *minMax.second - *minMax.first;
    if (amplitude <= 1e-10) return 0.0;

    const double meanJerkSquare = jerkSquareSum / (signal.size() - 2);
    return std::sqrt(meanJerkSquare) * std::pow(duration, 1.5) / amplitude;
}
