/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Types.hpp"
#include "inference/IModelProvider.hpp"
#include "pipeline/PipelineConfig.hpp"
#include "pipeline/SessionRecord.hpp"
#include "session/CardioEstimator.hpp"
#include "session/CrossedSyndromeDetector.hpp"
#include "session/FallRiskAnalyzer.hpp"
#include "session/FrailtyScreener.hpp"
#include "session/GaitPatternClassifier.hpp"
#include "session/PainRiskEngine.hpp"
#include "session/SessionAnalysis.hpp"

/// @brief Everything collected during one capture, handed over at stop
struct SessionData
{
    double startTime{0.0}; // wall clock, seconds since the epoch
    double durationSec{0.0};

    std::vector<BodyFrame> frames;
    std::vector<StepEvent> steps;
    std::vector<MotionSample> motionSamples;

    GaitSessionSummary gait;
    std::optional<RomSessionSummary> rom;
    std::optional<RombergResult> romberg;
    std::optional<FatigueAssessment> fatigue;
    std::optional<SmoothnessMetrics> smoothness;

    int imuStepCount{0};
    std::optional<PedometerSnapshot> pedometer;
    std::optional<double> tugTimeSec;
    double rootDistanceM{0.0};
};

/// @brief Reduces the recorded session to its summary, findings and encoded time series.
///
/// The gait pattern, the posture score and the fall risk go through DualPath, every other
/// session analyzer is rule based. Runs once per saved session, off the real-time path.
class SessionFinalizer
{
private:
    static constexpr double DEFAULT_STEP_LENGTH_M = 0.65;
    static constexpr double STANDING_SPEED_MPS = 0.2;

    std::shared_ptr<IModelProvider> provider;
    SubjectProfile profile;

    GaitPatternClassifier gaitPatternClassifier;
    FallRiskAnalyzer fallRiskAnalyzer;
    CrossedSyndromeDetector crossedSyndromeDetector;
    PainRiskEngine painRiskEngine;
    FrailtyScreener frailtyScreener;
    CardioEstimator cardioEstimator;
    SessionAnalysisEngine analysisEngine;

    void summarizePosture(const std::vector<BodyFrame> &frames, SessionSummary &summary) const;
    void summarizeGait(const SessionData &data, SessionSummary &summary) const;
    void summarizeRegions(const std::vector<BodyFrame> &frames, SessionSummary &summary) const;
    void summarizeFunction(const SessionData &data, SessionSummary &summary) const;

public:
    SessionFinalizer(const std::shared_ptr<IModelProvider> &provider, const SubjectProfile &profile)
        : provider(provider), profile(profile){};
    ~SessionFinalizer(){};

    SessionSummary Summarize(const SessionData &data) const;

    /// @brief Summary, analysis and the CBOR blobs of the frames, steps and motion samples
    SessionRecord Finalize(const SessionData &data) const;

    /// @brief Distance by priority: pedometer, root displacement, best step count times step length
    static std::pair<std::optional<double>, DistanceSource>
    ResolveDistance(const std::optional<PedometerSnapshot> &pedometer, const double rootDistanceM,
                    const int bestStepCount, const std::optional<double> &strideLengthM);

    /// @brief "YYYY-MM-DDThh:mm:ssZ"
    static std::string IsoDate(const double epochSeconds);
};
