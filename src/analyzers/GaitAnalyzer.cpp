/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "GaitAnalyzer.hpp"

#include <algorithm>
#include <cmath>

#include "MathUtil.hpp"

GaitAnalyzer::GaitAnalyzer() { Reset(); }

void GaitAnalyzer::Reset()
{
    feet = {FootState(), FootState()};
    strikeTimes.clear();
    strideLengths.clear();
    rootHistory.clear();
    stepWidths.clear();
    footClearances.clear();
    frameCount = 0;
    doubleSupportFrames = 0;
    stepCount = 0;
}

/// @brief Stance = foot near its floor height and almost still in the horizontal plane
void GaitAnalyzer::updateStance(FootState &state, const FootSample &sample)
{
    if (!state.floorHeight || sample.position.y < *state.floorHeight) state.floorHeight = sample.position.y;

    bool stance = false;
    if (state.previousSample)
    {
        const double dt = sample.timestamp - state.previousSample->timestamp;
        const double speed = dt > 0.0 ? MathUtil::XzDistance(sample.position, state.previousSample->position) / dt : 0.0;
        const double height = sample.position.y - *state.floorHeight;
        stance = height < STANCE_HEIGHT_TOLERANCE_M && speed < STANCE_SPEED_MAX_MPS;
    }

    if (state.inStance && !stance) state.toeOffTime = sample.timestamp;
    state.inStance = stance;
    if (stance) state.stanceFrames++;

    if (state.lastStrike)
    {
        state.maxHeightSinceStrike = std::max(state.maxHeightSinceStrike, sample.position.y - state.lastStrike->position.y);
    }
    state.previousSample = sample;
}

/// @brief The middle sample of the window is a strike when it is strictly lower than every other sample
std::optional<StepEvent> GaitAnalyzer::detectStrike(const Foot foot, const FootSample &sample)
{
    FootState &state = footState(foot);
    state.window.push_back(sample);
    if (state.window.size() > WINDOW_SIZE) state.window.pop_front();
    if (state.window.size() < WINDOW_SIZE) return std::nullopt;

    const size_t middle = WINDOW_SIZE / 2;
    const double middleHeight = state.window[middle].position.y;
    for (size_t i = 0; i < state.window.size(); i++)
    {
        if (i != middle && state.window[i].position.y <= middleHeight) return std::nullopt;
    }

    const FootSample &strike = state.window[middle];
    const FootSample &before = state.window[middle - 1];
    const double dt = strike.timestamp - before.timestamp;
    const double impactVelocity = dt > 0.0 ? std::abs(strike.position.y - before.position.y) / dt : 0.0;

    StepEvent step;
    completeStep(foot, strike, impactVelocity, step);
    return step;
}

void GaitAnalyzer::completeStep(const Foot foot, const FootSample &strike, const double impactVelocity, StepEvent &step)
{
    FootState &state = footState(foot);
    const FootState &other = footState(foot == Foot::Left ? Foot::Right : Foot::Left);

    step.timestamp = strike.timestamp;
    step.foot = foot;
    step.positionX = strike.position.x;
    step.positionZ = strike.position.z;
    step.impactVelocity = impactVelocity;

    if (state.lastStrike)
    {
        const double strideLength = MathUtil::XzDistance(strike.position, state.lastStrike->position);
        if (strideLength > 0.1 && strideLength < 3.0)
        {
            step.strideLengthM = strideLength;
            strideLengths.push_back(strideLength);
            if (strideLengths.size() > STRIDE_HISTORY) strideLengths.pop_front();
            state.recentStrideLengths.push_back(strideLength);
            if (state.recentStrideLengths.size() > SYMMETRY_HISTORY) state.recentStrideLengths.pop_front();

            // step length and width relative to the direction of progression of this stride
            if (other.lastStrike && other.lastStrike->timestamp > state.lastStrike->timestamp)
            {
                const cv::Point2d direction((strike.position.x - state.lastStrike->position.x) / strideLength,
                                            (strike.position.z - state.lastStrike->position.z) / strideLength);
                const cv::Point2d stepVector(strike.position.x - other.lastStrike->position.x,
                                             strike.position.z - other.lastStrike->position.z);
                const double along = stepVector.dot(direction);
                const double across = direction.x * stepVector.y - direction.y * stepVector.x;
                step.stepLengthM = std::abs(along);
                step.stepWidthCm = std::abs(across) * 100.0;
                state.stepLengths.push_back(std::abs(along));
                stepWidths.push_back(std::abs(across) * 100.0);
            }
        }

        state.strideTimes.push_back(strike.timestamp - state.lastStrike->timestamp);
        step.footClearanceM = state.maxHeightSinceStrike;
        footClearances.push_back(state.maxHeightSinceStrike);

        if (state.toeOffTime && *state.toeOffTime > state.lastStrike->timestamp && *state.toeOffTime < strike.timestamp)
        {
            step.stanceTimeSec = *state.toeOffTime - state.lastStrike->timestamp;
            step.swingTimeSec = strike.timestamp - *state.toeOffTime;
        }
    }

    state.lastStrike = strike;
    state.floorHeight = strike.position.y;
    state.maxHeightSinceStrike = 0.0;

    strikeTimes.push_back(strike.timestamp);
    while (!strikeTimes.empty() && strikeTimes.front() < strike.timestamp - CADENCE_WINDOW_SEC)
    {
        strikeTimes.pop_front();
    }
    stepCount++;
}

double GaitAnalyzer::cadence() const
{
    if (strikeTimes.size() < 2) return 0.0;
    const double duration = strikeTimes.back() - strikeTimes.front();
    if (duration <= 0.0) return 0.0;
    return (strikeTimes.size() - 1) / duration * 60.0;
}

double GaitAnalyzer::walkingSpeed() const
{
    if (rootHistory.size() < 2) return 0.0;
    const double duration = rootHistory.back().timestamp - rootHistory.front().timestamp;
    if (duration <= 0.0) return 0.0;
    return MathUtil::XzDistance(rootHistory.back().position, rootHistory.front().position) / duration;
}

std::optional<double> GaitAnalyzer::symmetryRatio() const
{
    const std::deque<double> &left = feet[0].recentStrideLengths;
    const std::deque<double> &right = feet[1].recentStrideLengths;
    if (left.size() < 3 || right.size() < 3) return std::nullopt;

    const double leftMean = MathUtil::Mean(std::vector<double>(left.begin(), left.end()));
    const double rightMean = MathUtil::Mean(std::vector<double>(right.begin(), right.end()));
    const double larger = std::max(leftMean, rightMean);
    if (larger <= 0.0) return std::nullopt;
    return std::min(leftMean, rightMean) / larger;
}

std::optional<GaitMetrics> GaitAnalyzer::ProcessFrame(const JointFrame &frame)
{
    const cv::Point3d *leftFoot = frame.Find(JointName::LeftFoot);
    const cv::Point3d *rightFoot = frame.Find(JointName::RightFoot);
    if (leftFoot == nullptr || rightFoot == nullptr) return std::nullopt;

    frameCount++;
    const cv::Point3d *root = frame.Find(JointName::Root);
    if (root != nullptr)
    {
        rootHistory.push_back({frame.timestamp, *root});
        while (rootHistory.front().timestamp < frame.timestamp - SPEED_WINDOW_SEC) rootHistory.pop_front();
    }

    const FootSample leftSample{frame.timestamp, *leftFoot};
    const FootSample rightSample{frame.timestamp, *rightFoot};
    updateStance(feet[0], leftSample);
    updateStance(feet[1], rightSample);
    if (feet[0].inStance && feet[1].inStance) doubleSupportFrames++;

    // both windows advance every frame, only one strike is reported per frame
    std::optional<StepEvent> step = detectStrike(Foot::Left, leftSample);
    if (step)
    {
        FootState &right = feet[1];
        right.window.push_back(rightSample);
        if (right.window.size() > WINDOW_SIZE) right.window.pop_front();
    }
    else
    {
        step = detectStrike(Foot::Right, rightSample);
    }

    GaitMetrics metrics;
    metrics.cadenceSPM = cadence();
    metrics.avgStrideLengthM =
        strideLengths.empty() ? 0.0 : MathUtil::Mean(std::vector<double>(strideLengths.begin(), strideLengths.end()));
    metrics.walkingSpeedMPS = walkingSpeed();
    metrics.symmetryRatio = symmetryRatio();
    metrics.stepDetected = step;
    return metrics;
}

GaitSessionSummary GaitAnalyzer::SessionSummary() const
{
    GaitSessionSummary summary;
    summary.stepCount = stepCount;

    if (frameCount > 0)
    {
        summary.stanceLeftPercent = 100.0 * feet[0].stanceFrames / frameCount;
        summary.stanceRightPercent = 100.0 * feet[1].stanceFrames / frameCount;
        summary.doubleSupportPercent = 100.0 * doubleSupportFrames / frameCount;
    }

    std::vector<double> strideTimes = feet[0].strideTimes;
    strideTimes.insert(strideTimes.end(), feet[1].strideTimes.begin(), feet[1].strideTimes.end());
    if (strideTimes.size() >= 3) summary.strideTimeCVPercent = MathUtil::CoefficientOfVariationPercent(strideTimes);

    if (!stepWidths.empty()) summary.stepWidthMeanCm = MathUtil::Mean(stepWidths);
    if (stepWidths.size() >= 2) summary.stepWidthSDCm = MathUtil::StandardDeviation(stepWidths);

    if (!feet[0].stepLengths.empty()) summary.stepLengthLeftM = MathUtil::Mean(feet[0].stepLengths);
    if (!feet[1].stepLengths.empty()) summary.stepLengthRightM = MathUtil::Mean(feet[1].stepLengths);
    if (summary.stepLengthLeftM && summary.stepLengthRightM)
    {
        // lengths are in metres, the index needs a mean above 0.1 so compare in centimetres
        summary.stepAsymmetryPercent =
            MathUtil::RobinsonSymmetryIndex(*summary.stepLengthLeftM * 100.0, *summary.stepLengthRightM * 100.0);
    }

    if (!footClearances.empty()) summary.footClearanceM = MathUtil::Mean(footClearances);
    if (!strideLengths.empty())
    {
        summary.strideLengthM = MathUtil::Mean(std::vector<double>(strideLengths.begin(), strideLengths.end()));
    }
    return summary;
}
