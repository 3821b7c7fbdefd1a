/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SessionFinalizer.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iterator>
#include <sstream>

#include "MathUtil.hpp"
#include "analyzers/PostureAnalyzer.hpp"
#include "inference/DualPath.hpp"
#include "inference/InferencePaths.hpp"
#include "pipeline/SessionCodec.hpp"

namespace
{
    using FrameValue = std::function<std::optional<double>(const BodyFrame &)>;

    /// @retval std::nullopt when no frame carries the value
    std::optional<double> meanOf(const std::vector<BodyFrame> &frames, const FrameValue &value)
    {
        std::vector<double> values;
        for (const BodyFrame &frame : frames)
        {
            const std::optional<double> v = value(frame);
            if (v) values.push_back(*v);
        }
        if (values.empty()) return std::nullopt;
        return MathUtil::Mean(values);
    }

    std::optional<double> positive(const double value)
    {
        return value > 0.0 ? std::optional<double>(value) : std::nullopt;
    }

    std::optional<double> bilateral(const std::optional<double> &left, const std::optional<double> &right)
    {
        if (left && right) return 0.5 * (*left + *right);
        return left ? left : right;
    }

    // frames on which the posture analyzer has produced a result
    std::vector<BodyFrame> postureFrames(const std::vector<BodyFrame> &frames)
    {
        std::vector<BodyFrame> measured;
        std::copy_if(frames.begin(), frames.end(), std::back_inserter(measured),
                     [](const BodyFrame &frame) { return frame.posturalType.has_value(); });
        return measured;
    }

    PostureMetrics averageMetrics(const std::vector<BodyFrame> &measured)
    {
        PostureMetrics m;
        m.trunkLeanDeg = *meanOf(measured, [](const BodyFrame &f) { return std::optional<double>(f.trunkLeanDeg); });
        m.lateralLeanDeg = *meanOf(measured, [](const BodyFrame &f) { return std::optional<double>(f.lateralLeanDeg); });
        m.craniovertebralAngleDeg =
            *meanOf(measured, [](const BodyFrame &f) { return std::optional<double>(f.craniovertebralAngleDeg); });
        m.sagittalVerticalAxisCm =
            *meanOf(measured, [](const BodyFrame &f) { return std::optional<double>(f.sagittalVerticalAxisCm); });

        // occluded measures stay absent when no frame observed them
        m.shoulderAsymmetryCm = meanOf(measured, [](const BodyFrame &f) { return f.shoulderAsymmetryCm; });
        m.shoulderTiltDeg = meanOf(measured, [](const BodyFrame &f) { return f.shoulderTiltDeg; });
        m.shoulderProtractionCm = meanOf(measured, [](const BodyFrame &f) { return f.shoulderProtractionCm; });
        m.pelvicObliquityDeg = meanOf(measured, [](const BodyFrame &f) { return f.pelvicObliquityDeg; });
        m.pelvicTiltDeg = meanOf(measured, [](const BodyFrame &f) { return f.pelvicTiltDeg; });
        m.thoracicKyphosisDeg = meanOf(measured, [](const BodyFrame &f) { return f.thoracicKyphosisDeg; });
        m.lumbarLordosisDeg = meanOf(measured, [](const BodyFrame &f) { return f.lumbarLordosisDeg; });
        m.cervicalLordosisDeg = meanOf(measured, [](const BodyFrame &f) { return f.cervicalLordosisDeg; });
        m.coronalSpineDeviationCm = meanOf(measured, [](const BodyFrame &f) { return f.coronalSpineDeviationCm; });
        return m;
    }
}

std::pair<std::optional<double>, DistanceSource>
SessionFinalizer::ResolveDistance(const std::optional<PedometerSnapshot> &pedometer, const double rootDistanceM,
                                  const int bestStepCount, const std::optional<double> &strideLengthM)
{
    if (pedometer && pedometer->distanceM > 0.0) return {pedometer->distanceM, DistanceSource::Pedometer};
    if (rootDistanceM > 0.0) return {rootDistanceM, DistanceSource::BodyTracking};
    if (bestStepCount > 0)
    {
        const double stepLength = strideLengthM && *strideLengthM > 0.0 ? *strideLengthM / 2.0 : DEFAULT_STEP_LENGTH_M;
        return {bestStepCount * stepLength, DistanceSource::StepEstimate};
    }
    return {std::nullopt, DistanceSource::None};
}

std::string SessionFinalizer::IsoDate(const double epochSeconds)
{
    const std::time_t seconds = static_cast<std::time_t>(std::floor(epochSeconds));
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void SessionFinalizer::summarizePosture(const std::vector<BodyFrame> &frames, SessionSummary &summary) const
{
    const std::vector<BodyFrame> measured = postureFrames(frames);
    if (measured.empty()) return;

    const PostureMetrics average = averageMetrics(measured);
    summary.averageTrunkLeanDeg = average.trunkLeanDeg;
    summary.averageLateralLeanDeg = average.lateralLeanDeg;
    summary.averageCvaDeg = average.craniovertebralAngleDeg;
    summary.averageSvaCm = average.sagittalVerticalAxisCm;
    summary.averageShoulderAsymmetryCm = average.shoulderAsymmetryCm;
    summary.averagePelvicObliquityDeg = average.pelvicObliquityDeg;
    summary.averageKyphosisDeg = average.thoracicKyphosisDeg;
    summary.averageLordosisDeg = average.lumbarLordosisDeg;
    summary.averageCoronalDeviationCm = average.coronalSpineDeviationCm;

    for (const BodyFrame &frame : measured)
    {
        summary.peakTrunkLeanDeg = std::max(summary.peakTrunkLeanDeg, std::abs(frame.trunkLeanDeg));
        summary.peakLateralLeanDeg = std::max(summary.peakLateralLeanDeg, std::abs(frame.lateralLeanDeg));
    }

    const DualPath<PostureScore> scorer(provider, ModelId::PostureScorer);
    const PostureScore score = scorer.Run(
        [&average]() { return PostureAnalyzer::ComputeScore(PostureScoreInput::FromMetrics(average)); },
        [](IInferenceModel &model, const PostureScore &ruleResult) {
            return InferencePaths::PredictPostureScore(model, ruleResult);
        });
    summary.postureScore = score.compositeScore;

    summary.kendallType =
        PostureAnalyzer::ClassifyKendall(average.craniovertebralAngleDeg, average.sagittalVerticalAxisCm,
                                         average.thoracicKyphosisDeg, average.lumbarLordosisDeg, average.pelvicTiltDeg);
    summary.nyprScore = PostureAnalyzer::ComputeNypr(average);
}

void SessionFinalizer::summarizeGait(const SessionData &data, SessionSummary &summary) const
{
    const std::vector<BodyFrame> &frames = data.frames;
    summary.averageCadenceSPM = meanOf(frames, [](const BodyFrame &f) { return positive(f.cadenceSPM); });
    summary.averageStrideLengthM = meanOf(frames, [](const BodyFrame &f) { return positive(f.avgStrideLengthM); });
    summary.averageWalkingSpeedMPS = meanOf(frames, [](const BodyFrame &f) { return positive(f.walkingSpeedMPS); });
    summary.averageSwayVelocityMMS = meanOf(frames, [](const BodyFrame &f) {
        return f.swayVelocityMMS && *f.swayVelocityMMS > 0.0 ? f.swayVelocityMMS : std::nullopt;
    });
    summary.gait = data.gait;

    // step counts and distance
    summary.skeletonStepCount = static_cast<int>(data.steps.size());
    summary.imuStepCount = data.imuStepCount;
    summary.lowConfidenceStepCount = static_cast<int>(
        std::count_if(data.steps.begin(), data.steps.end(), [](const StepEvent &step) { return step.lowConfidence; }));
    if (data.pedometer) summary.pedometerStepCount = data.pedometer->stepCount;

    int bestStepCount = summary.skeletonStepCount;
    if (summary.imuStepCount > 0) bestStepCount = summary.imuStepCount;
    if (summary.pedometerStepCount && *summary.pedometerStepCount > 0) bestStepCount = *summary.pedometerStepCount;

    const std::optional<double> strideLength =
        data.gait.strideLengthM ? data.gait.strideLengthM : summary.averageStrideLengthM;
    const auto distance = ResolveDistance(data.pedometer, data.rootDistanceM, bestStepCount, strideLength);
    summary.distanceM = distance.first;
    summary.distanceSource = distance.second;

    // gait pattern
    if (data.gait.stepCount > 0)
    {
        GaitPatternInput input;
        input.stanceTimeLeftPercent = data.gait.stanceLeftPercent;
        input.stanceTimeRightPercent = data.gait.stanceRightPercent;
        input.stepLengthLeftM = data.gait.stepLengthLeftM;
        input.stepLengthRightM = data.gait.stepLengthRightM;
        input.cadenceSPM = summary.averageCadenceSPM;
        input.avgStepWidthCm = data.gait.stepWidthMeanCm;
        input.stepWidthVariabilityCm = data.gait.stepWidthSDCm;
        input.pelvicObliquityDeg = summary.averagePelvicObliquityDeg;
        input.strideTimeCVPercent = data.gait.strideTimeCVPercent;
        input.walkingSpeedMPS = summary.averageWalkingSpeedMPS;
        input.strideLengthM = strideLength;
        if (data.rom)
        {
            input.hipFlexionRomDeg = data.rom->HipRomDeg();
            input.armSwingAsymmetryPercent = data.rom->armSwingAsymmetryPercent;
            input.kneeFlexionRomDeg = data.rom->KneeRomDeg();
        }

        const DualPath<GaitPatternResult> classifier(provider, ModelId::GaitPatternClassifier);
        summary.gaitPattern = classifier.Run([this, &input]() { return gaitPatternClassifier.Classify(input); },
                                             [&input](IInferenceModel &model, const GaitPatternResult &ruleResult) {
                                                 return InferencePaths::PredictGaitPattern(model, input, ruleResult);
                                             });
    }

    // fall risk
    FallRiskInput fallInput;
    fallInput.walkingSpeedMPS = summary.averageWalkingSpeedMPS;
    fallInput.strideTimeCVPercent = data.gait.strideTimeCVPercent;
    fallInput.doubleSupportPercent = data.gait.doubleSupportPercent;
    fallInput.stepWidthVariabilityCm = data.gait.stepWidthSDCm;
    fallInput.swayVelocityMMS = summary.averageSwayVelocityMMS;
    fallInput.stepAsymmetryPercent = data.gait.stepAsymmetryPercent;
    fallInput.tugTimeSec = data.tugTimeSec;
    fallInput.footClearanceM = data.gait.footClearanceM;

    const bool hasFallRiskInput = fallInput.walkingSpeedMPS || fallInput.strideTimeCVPercent ||
                                  fallInput.doubleSupportPercent || fallInput.stepWidthVariabilityCm ||
                                  fallInput.swayVelocityMMS || fallInput.stepAsymmetryPercent ||
                                  fallInput.tugTimeSec || fallInput.footClearanceM;
    if (hasFallRiskInput)
    {
        const DualPath<FallRiskAssessment> predictor(provider, ModelId::FallRiskPredictor);
        summary.fallRisk = predictor.Run([this, &fallInput]() { return fallRiskAnalyzer.Assess(fallInput); },
                                         [&fallInput](IInferenceModel &model, const FallRiskAssessment &ruleResult) {
                                             return InferencePaths::PredictFallRisk(model, fallInput, ruleResult);
                                         });
    }
}

void SessionFinalizer::summarizeRegions(const std::vector<BodyFrame> &frames, SessionSummary &summary) const
{
    const std::vector<BodyFrame> measured = postureFrames(frames);
    if (measured.empty()) return;

    const PostureMetrics average = averageMetrics(measured);

    std::vector<BodyFrame> standing;
    std::copy_if(frames.begin(), frames.end(), std::back_inserter(standing),
                 [](const BodyFrame &frame) { return frame.walkingSpeedMPS < STANDING_SPEED_MPS; });
    const std::optional<double> hipFlexionRest =
        meanOf(standing, [](const BodyFrame &f) { return bilateral(f.hipFlexionLeftDeg, f.hipFlexionRightDeg); });
    const std::optional<double> kneeFlexionStanding =
        meanOf(standing, [](const BodyFrame &f) { return bilateral(f.kneeFlexionLeftDeg, f.kneeFlexionRightDeg); });

    // each engine needs its measures observed at least once
    if (average.shoulderProtractionCm && average.thoracicKyphosisDeg && average.pelvicTiltDeg &&
        average.lumbarLordosisDeg)
    {
        CrossedSyndromeInput crossed;
        crossed.craniovertebralAngleDeg = average.craniovertebralAngleDeg;
        crossed.shoulderProtractionCm = *average.shoulderProtractionCm;
        crossed.thoracicKyphosisDeg = *average.thoracicKyphosisDeg;
        crossed.cervicalLordosisDeg = average.cervicalLordosisDeg;
        crossed.pelvicTiltDeg = *average.pelvicTiltDeg;
        crossed.lumbarLordosisDeg = *average.lumbarLordosisDeg;
        crossed.hipFlexionRestDeg = hipFlexionRest;
        summary.crossedSyndrome = crossedSyndromeDetector.Detect(crossed);
    }

    if (average.thoracicKyphosisDeg && average.lumbarLordosisDeg && average.shoulderAsymmetryCm &&
        average.pelvicObliquityDeg && average.pelvicTiltDeg && average.coronalSpineDeviationCm)
    {
        PainRiskInput pain;
        pain.craniovertebralAngleDeg = average.craniovertebralAngleDeg;
        pain.sagittalVerticalAxisCm = average.sagittalVerticalAxisCm;
        pain.thoracicKyphosisDeg = *average.thoracicKyphosisDeg;
        pain.lumbarLordosisDeg = *average.lumbarLordosisDeg;
        pain.shoulderAsymmetryCm = *average.shoulderAsymmetryCm;
        pain.pelvicObliquityDeg = *average.pelvicObliquityDeg;
        pain.pelvicTiltDeg = *average.pelvicTiltDeg;
        pain.coronalSpineDeviationCm = *average.coronalSpineDeviationCm;
        pain.kneeFlexionStandingDeg = kneeFlexionStanding;
        pain.gaitAsymmetryPercent = summary.gait.stepAsymmetryPercent;
        summary.painRisk = painRiskEngine.Assess(pain);
    }
}

void SessionFinalizer::summarizeFunction(const SessionData &data, SessionSummary &summary) const
{
    // ergonomics
    std::vector<double> rebaScores;
    for (const BodyFrame &frame : data.frames)
    {
        if (frame.rebaScore) rebaScores.push_back(*frame.rebaScore);
    }
    if (!rebaScores.empty())
    {
        summary.averageRebaScore = MathUtil::Mean(rebaScores);
        summary.peakRebaScore = static_cast<int>(*std::max_element(rebaScores.begin(), rebaScores.end()));
    }

    summary.fatigue = data.fatigue;
    summary.smoothness = data.smoothness;
    summary.rom = data.rom;
    summary.romberg = data.romberg;

    if (!data.frames.empty())
    {
        std::vector<double> postureScores;
        for (const BodyFrame &frame : postureFrames(data.frames)) postureScores.push_back(frame.postureScore);

        FrailtyInput frailty;
        frailty.walkingSpeedMPS = summary.averageWalkingSpeedMPS;
        frailty.heightM = profile.heightM;
        frailty.sex = profile.sex;
        frailty.dailyStepCount = profile.dailyStepCount;
        if (postureScores.size() >= 2) frailty.postureVariabilitySD = MathUtil::StandardDeviation(postureScores);
        frailty.strideTimeCVPercent = data.gait.strideTimeCVPercent;
        frailty.weightLossSelfReport = profile.weightLossSelfReport;
        summary.frailty = frailtyScreener.Screen(frailty);
    }

    if (summary.averageWalkingSpeedMPS)
    {
        summary.cardio = cardioEstimator.Estimate(*summary.averageWalkingSpeedMPS,
                                                  summary.averageCadenceSPM.value_or(0.0),
                                                  summary.averageStrideLengthM.value_or(0.0));
        summary.predictedSixMinuteWalkM =
            cardioEstimator
                .EvaluateSixMinuteWalk(summary.distanceM.value_or(0.0), profile.ageYears, profile.heightM,
                                       profile.weightKg, profile.sex)
                .predictedDistanceM;
    }

    if (data.tugTimeSec) summary.tug = cardioEstimator.EvaluateTug(*data.tugTimeSec);
}

SessionSummary SessionFinalizer::Summarize(const SessionData &data) const
{
    SessionSummary summary;
    summary.date = IsoDate(data.startTime);
    summary.startTimestamp = data.startTime;
    summary.durationSec = data.durationSec;
    summary.frameCount = data.frames.size();

    summarizePosture(data.frames, summary);
    summarizeGait(data, summary);
    summarizeRegions(data.frames, summary);
    summarizeFunction(data, summary);
    return summary;
}

SessionRecord SessionFinalizer::Finalize(const SessionData &data) const
{
    SessionRecord record;
    record.summary = Summarize(data);
    record.analysis = analysisEngine.Analyze(record.summary);
    record.framesBlob = SessionCodec::EncodeFrames(data.frames);
    record.stepsBlob = SessionCodec::EncodeSteps(data.steps);
    record.motionBlob = SessionCodec::EncodeMotion(data.motionSamples);
    return record;
}
