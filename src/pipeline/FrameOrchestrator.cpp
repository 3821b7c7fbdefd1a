/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "FrameOrchestrator.hpp"

#include <chrono>
#include <cmath>
#include <iostream>

#include "MathUtil.hpp"

FrameOrchestrator::FrameOrchestrator(const PipelineConfig &config, const std::shared_ptr<ISensorService> &bodyTracker,
                                     const std::shared_ptr<ISensorService> &motionService,
                                     const std::shared_ptr<IModelProvider> &provider,
                                     const SessionRecorder::Clock &clock)
    : config(config), recorder(config.recorderCapacity, clock), finalizer(provider, config.profile),
      bodyTracker(bodyTracker), motionService(motionService), hasMotionData(false), rootDistanceM(0.0),
      hasRomData(false), sessionStartTime(0.0), tickTimer("Tick")
{
}

void FrameOrchestrator::reportError(const ErrorKind kind, const std::string &message)
{
    const AppError error{kind, message};
    std::cerr << error.ToString() << std::endl;
    {
        std::lock_guard<std::mutex> lock(liveMutex);
        lastError = error;
    }
    if (errorHandler) errorHandler(error);
}

bool FrameOrchestrator::StartCapture()
{
    if (recorder.State() != RecorderState::Idle) return false;

    if (bodyTracker == nullptr || !bodyTracker->Start())
    {
        reportError(ErrorKind::SensorUnavailable, "Body tracker could not be started");
        return false;
    }

    std::lock_guard<std::mutex> frameLock(frameMutex);
    resetSession();
    if (!recorder.StartCalibration()) return false;

    if (config.calibrationSeconds <= 0.0)
    {
        beginRecording();
        return true;
    }

    std::lock_guard<std::mutex> lock(liveMutex);
    live.calibrationCountdown = static_cast<int>(std::ceil(config.calibrationSeconds));
    return true;
}

void FrameOrchestrator::beginRecording()
{
    if (motionService != nullptr && !motionService->Start())
    {
        reportError(ErrorKind::SensorUnavailable, motionService->Name() + " could not be started, continuing without it");
    }

    const auto now = std::chrono::system_clock::now().time_since_epoch();
    sessionStartTime = std::chrono::duration<double>(now).count();
    if (!recorder.StartRecording())
    {
        std::cerr << "Recording could not be started from state " << ToString(recorder.State()) << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(liveMutex);
    live.calibrationCountdown.reset();
}

void FrameOrchestrator::OnJointFrame(const JointFrame &frame)
{
    std::optional<double> alertScore;
    {
        std::lock_guard<std::mutex> lock(frameMutex);
        switch (recorder.State())
        {
        case RecorderState::Calibrating:
            onCalibrationFrame(frame);
            break;
        case RecorderState::Recording:
            alertScore = onRecordingFrame(frame);
            break;
        default:
            break;
        }
    }
    if (alertScore && alertHandler) alertHandler(*alertScore);
}

void FrameOrchestrator::onCalibrationFrame(const JointFrame &frame)
{
    if (!calibrationStart) calibrationStart = frame.timestamp;

    const double elapsed = frame.timestamp - *calibrationStart;
    if (elapsed >= config.calibrationSeconds)
    {
        beginRecording();
        return;
    }

    std::lock_guard<std::mutex> lock(liveMutex);
    live.calibrationCountdown = static_cast<int>(std::ceil(config.calibrationSeconds - elapsed));
}

std::optional<double> FrameOrchestrator::onRecordingFrame(const JointFrame &frame)
{
    tickTimer.Start();
    frameIndex.Advance();

    LiveMetrics next = LiveSnapshot();
    next.frameIndex = frameIndex.Value();

    // every tick, occluded measures keep their cached value
    const std::optional<PostureAssessment> posture = postureAnalyzer.Analyze(frame);
    if (posture) next.UpdatePosture(*posture);
    const std::optional<GaitMetrics> gait = gaitAnalyzer.ProcessFrame(frame);
    if (gait)
        next.gait = *gait;
    else
        next.gait.stepDetected.reset();

    // throttled
    const ThrottleConfig &throttle = config.throttle;
    if (frameIndex.IsDue(throttle.rom))
    {
        const RomMetrics rom = romAnalyzer.Analyze(frame);
        romAnalyzer.RecordFrame(rom);
        next.UpdateRom(rom);
        hasRomData = true;
    }
    if (frameIndex.IsDue(throttle.balance))
    {
        const cv::Point3d *root = frame.Find(JointName::Root);
        if (root != nullptr) next.balance = balanceAnalyzer.ProcessFrame(*root, frame.timestamp);
    }
    if (frameIndex.IsDue(throttle.ergonomics))
    {
        const std::optional<RebaResult> reba = ergonomicScorer.Compute(frame);
        if (reba) next.reba = reba;
    }
    if (frameIndex.IsDue(throttle.fatigue) && posture && gait)
    {
        fatigueAnalyzer.RecordTimePoint(frame.timestamp, posture->score.compositeScore, posture->metrics.trunkLeanDeg,
                                        posture->metrics.lateralLeanDeg, gait->cadenceSPM, gait->walkingSpeedMPS);
    }

    {
        std::lock_guard<std::mutex> lock(motionMutex);
        if (next.gait.stepDetected && hasMotionData)
        {
            StepEvent &step = *next.gait.stepDetected;
            step.imuConfidence = imuStepDetector.ValidateStep(step.timestamp);
            step.lowConfidence = *step.imuConfidence < LOW_CONFIDENCE;
        }
        if (hasMotionData) next.imuCadenceSPM = imuStepDetector.CadenceSPM();
    }
    if (next.gait.stepDetected) recorder.RecordStep(*next.gait.stepDetected);

    updateDistance(frame);
    recorder.RecordFrame(next.ToBodyFrame(frame));

    {
        std::lock_guard<std::mutex> lock(liveMutex);
        live = next;
    }
    tickTimer.End();

    if (posture && isPostureAlertDue(posture->score.compositeScore)) return posture->score.compositeScore;
    return std::nullopt;
}

void FrameOrchestrator::updateDistance(const JointFrame &frame)
{
    const cv::Point3d *root = frame.Find(JointName::Root);
    if (root == nullptr) return;

    if (!distanceAnchor)
    {
        distanceAnchor = *root;
        return;
    }

    // tracking jumps move the anchor without adding distance
    const double moved = MathUtil::XzDistance(*distanceAnchor, *root);
    if (moved >= MAX_ROOT_MOVE_M)
    {
        distanceAnchor = *root;
    }
    else if (moved > MIN_ROOT_MOVE_M)
    {
        rootDistanceM += moved;
        distanceAnchor = *root;
    }
}

bool FrameOrchestrator::isPostureAlertDue(const double postureScore)
{
    if (postureScore >= config.postureAlert.threshold) return false;

    const long long tick = frameIndex.Value();
    if (lastAlertTick && tick - *lastAlertTick < config.postureAlert.cooldownTicks) return false;

    lastAlertTick = tick;
    return true;
}

void FrameOrchestrator::OnMotionSample(const MotionSample &sample)
{
    if (recorder.State() != RecorderState::Recording) return;

    recorder.RecordMotion(sample);

    std::lock_guard<std::mutex> lock(motionMutex);
    hasMotionData = true;
    imuStepDetector.ProcessSample(sample.timestamp, sample.userAcceleration[1]);
    smoothnessAnalyzer.RecordSample(sample.timestamp, sample.userAcceleration[2], sample.userAcceleration[0],
                                    sample.userAcceleration[1]);
}

void FrameOrchestrator::OnPedometerSnapshot(const PedometerSnapshot &snapshot)
{
    if (recorder.State() != RecorderState::Recording) return;

    std::lock_guard<std::mutex> lock(motionMutex);
    pedometer = snapshot;
}

bool FrameOrchestrator::TogglePause()
{
    switch (recorder.State())
    {
    case RecorderState::Recording:
        return recorder.Pause();
    case RecorderState::Paused:
        return recorder.Resume();
    default:
        return false;
    }
}

void FrameOrchestrator::stopSensors()
{
    if (bodyTracker != nullptr) bodyTracker->Stop();
    if (motionService != nullptr) motionService->Stop();
}

bool FrameOrchestrator::StopCapture()
{
    if (!recorder.Stop()) return false;

    stopSensors();
    std::lock_guard<std::mutex> lock(frameMutex);
    if (tickTimer.Count() > 0) std::cout << tickTimer.ResultString() << std::endl;
    return true;
}

void FrameOrchestrator::Cancel()
{
    stopSensors();
    recorder.Cancel();
    {
        std::lock_guard<std::mutex> lock(frameMutex);
        resetSession();
        tugTimeSec.reset();
    }
    std::cout << "Capture cancelled" << std::endl;
}

// frameMutex held
void FrameOrchestrator::resetSession()
{
    gaitAnalyzer.Reset();
    romAnalyzer.Reset();
    balanceAnalyzer.Reset();
    fatigueAnalyzer.Reset();
    {
        std::lock_guard<std::mutex> lock(motionMutex);
        imuStepDetector.Reset();
        smoothnessAnalyzer.Reset();
        hasMotionData = false;
        pedometer.reset();
    }
    {
        std::lock_guard<std::mutex> lock(liveMutex);
        live = LiveMetrics();
    }

    frameIndex.Reset();
    calibrationStart.reset();
    lastAlertTick.reset();
    distanceAnchor.reset();
    rootDistanceM = 0.0;
    hasRomData = false;
    romberg.reset();
    tickTimer.Reset();
}

SessionData FrameOrchestrator::collectSession()
{
    SessionData data;
    data.startTime = sessionStartTime;
    data.durationSec = recorder.ElapsedTime();
    data.frames = recorder.Frames();
    data.steps = recorder.Steps();
    data.motionSamples = recorder.MotionSamples();

    data.gait = gaitAnalyzer.SessionSummary();
    if (hasRomData) data.rom = romAnalyzer.SessionSummary();
    data.romberg = romberg;
    if (fatigueAnalyzer.HasEnoughSamples()) data.fatigue = fatigueAnalyzer.Assess();

    {
        std::lock_guard<std::mutex> lock(motionMutex);
        if (smoothnessAnalyzer.HasEnoughSamples()) data.smoothness = smoothnessAnalyzer.Analyze();
        data.imuStepCount = imuStepDetector.StepCount();
        data.pedometer = pedometer;
    }

    data.tugTimeSec = tugTimeSec;
    data.rootDistanceM = rootDistanceM;
    return data;
}

std::optional<SessionRecord> FrameOrchestrator::SaveSession(ISessionSink &sink)
{
    if (recorder.State() != RecorderState::Finished)
    {
        reportError(ErrorKind::InvalidInput, "No stopped session to save (state " + ToString(recorder.State()) + ")");
        return std::nullopt;
    }

    SessionData data;
    {
        std::lock_guard<std::mutex> lock(frameMutex);
        data = collectSession();
    }
    const SessionRecord record = finalizer.Finalize(data);
    if (!sink.Save(record))
    {
        reportError(ErrorKind::PersistenceFailed, "Session could not be saved, data is kept for a retry");
        return std::nullopt;
    }

    recorder.Reset();
    std::lock_guard<std::mutex> lock(frameMutex);
    resetSession();
    tugTimeSec.reset();
    return record;
}

bool FrameOrchestrator::RecordTugTime(const double seconds)
{
    if (!(seconds > 0.0))
    {
        reportError(ErrorKind::InvalidInput, "TUG time must be positive");
        return false;
    }
    std::lock_guard<std::mutex> lock(frameMutex);
    tugTimeSec = seconds;
    return true;
}

void FrameOrchestrator::StartRombergEyesOpen()
{
    std::lock_guard<std::mutex> lock(frameMutex);
    balanceAnalyzer.StartRombergEyesOpen();
}

void FrameOrchestrator::StartRombergEyesClosed()
{
    std::lock_guard<std::mutex> lock(frameMutex);
    balanceAnalyzer.StartRombergEyesClosed();
}

std::optional<RombergResult> FrameOrchestrator::CompleteRomberg()
{
    std::lock_guard<std::mutex> lock(frameMutex);
    const std::optional<RombergResult> result = balanceAnalyzer.CompleteRomberg();
    if (result) romberg = result;
    return result;
}

LiveMetrics FrameOrchestrator::LiveSnapshot() const
{
    std::lock_guard<std::mutex> lock(liveMutex);
    return live;
}

std::optional<int> FrameOrchestrator::Countdown() const
{
    std::lock_guard<std::mutex> lock(liveMutex);
    return live.calibrationCountdown;
}

std::optional<AppError> FrameOrchestrator::LastError() const
{
    std::lock_guard<std::mutex> lock(liveMutex);
    return lastError;
}
