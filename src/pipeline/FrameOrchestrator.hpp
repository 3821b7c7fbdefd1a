/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "Types.hpp"
#include "analyzers/BalanceAnalyzer.hpp"
#include "analyzers/ErgonomicScorer.hpp"
#include "analyzers/GaitAnalyzer.hpp"
#include "analyzers/ImuStepDetector.hpp"
#include "analyzers/PostureAnalyzer.hpp"
#include "analyzers/RomAnalyzer.hpp"
#include "inference/IModelProvider.hpp"
#include "pipeline/AppError.hpp"
#include "pipeline/ISensorService.hpp"
#include "pipeline/ISessionSink.hpp"
#include "pipeline/LiveMetrics.hpp"
#include "pipeline/PipelineConfig.hpp"
#include "pipeline/SessionFinalizer.hpp"
#include "pipeline/SessionRecorder.hpp"
#include "session/FatigueAnalyzer.hpp"
#include "session/SmoothnessAnalyzer.hpp"
#include "utils/Timer.hpp"

/// @brief Called with the live posture score when it drops below the alert threshold
using PostureAlertHandler = std::function<void(const double postureScore)>;

/// @brief Real-time loop of a capture.
///
/// Every joint frame of the recording state runs posture and gait; ROM, balance, ergonomics
/// and fatigue sampling run on their throttle periods and keep their last value in between.
/// The frame, motion and pedometer callbacks may come from different threads. The error handler
/// runs while a frame is processed and must not call back into the orchestrator.
class FrameOrchestrator
{
private:
    static constexpr double LOW_CONFIDENCE = 0.2;
    static constexpr double MIN_ROOT_MOVE_M = 0.05;
    static constexpr double MAX_ROOT_MOVE_M = 2.0;

    PipelineConfig config;
    SessionRecorder recorder;
    SessionFinalizer finalizer;
    std::shared_ptr<ISensorService> bodyTracker;
    std::shared_ptr<ISensorService> motionService;

    // guarded by motionMutex
    std::mutex motionMutex;
    ImuStepDetector imuStepDetector;
    SmoothnessAnalyzer smoothnessAnalyzer;
    bool hasMotionData;
    std::optional<PedometerSnapshot> pedometer;

    // guarded by liveMutex
    mutable std::mutex liveMutex;
    LiveMetrics live;
    std::optional<AppError> lastError;

    // guarded by frameMutex, taken before motionMutex and liveMutex
    std::mutex frameMutex;
    PostureAnalyzer postureAnalyzer;
    GaitAnalyzer gaitAnalyzer;
    RomAnalyzer romAnalyzer;
    BalanceAnalyzer balanceAnalyzer;
    ErgonomicScorer ergonomicScorer;
    FatigueAnalyzer fatigueAnalyzer;
    FrameIndex frameIndex;
    std::optional<double> calibrationStart;
    std::optional<long long> lastAlertTick;
    std::optional<cv::Point3d> distanceAnchor;
    double rootDistanceM;
    bool hasRomData;
    double sessionStartTime;
    std::optional<double> tugTimeSec;
    std::optional<RombergResult> romberg;

    ErrorHandler errorHandler;
    PostureAlertHandler alertHandler;
    Timer tickTimer;

    void reportError(const ErrorKind kind, const std::string &message);
    void beginRecording();
    void onCalibrationFrame(const JointFrame &frame);
    /// @return posture score to alert on
    std::optional<double> onRecordingFrame(const JointFrame &frame);
    void updateDistance(const JointFrame &frame);
    bool isPostureAlertDue(const double postureScore);
    void stopSensors();
    void resetSession();
    SessionData collectSession();

public:
    /// @param motionService may be nullptr, the capture then runs without inertial data
    FrameOrchestrator(const PipelineConfig &config, const std::shared_ptr<ISensorService> &bodyTracker,
                      const std::shared_ptr<ISensorService> &motionService,
                      const std::shared_ptr<IModelProvider> &provider,
                      const SessionRecorder::Clock &clock = SessionRecorder::SteadyClock());
    ~FrameOrchestrator(){};

    /// @brief Starts the body tracker and the calibration countdown
    /// @retval false when a capture is already running or the body tracker is unavailable
    bool StartCapture();

    void OnJointFrame(const JointFrame &frame);
    void OnMotionSample(const MotionSample &sample);
    void OnPedometerSnapshot(const PedometerSnapshot &snapshot);

    /// @brief recording <-> paused
    bool TogglePause();

    /// @brief Stops the sensors. The session stays in memory until it is saved or cancelled.
    bool StopCapture();

    /// @brief Discards everything captured so far and returns to idle
    void Cancel();

    /// @brief Finalizes the stopped session and writes it through the sink.
    /// @retval std::nullopt when there is no stopped session or the write failed. Data is kept for a retry.
    std::optional<SessionRecord> SaveSession(ISessionSink &sink);

    /// @brief Timed Up and Go result included in the next saved session
    bool RecordTugTime(const double seconds);

    void StartRombergEyesOpen();
    void StartRombergEyesClosed();
    std::optional<RombergResult> CompleteRomberg();

    LiveMetrics LiveSnapshot() const;
    RecorderState State() const { return recorder.State(); }
    RecorderSnapshot RecorderStatus() const { return recorder.Snapshot(); }
    double ElapsedTime() const { return recorder.ElapsedTime(); }

    /// @brief Seconds left of the calibration, absent outside calibration
    std::optional<int> Countdown() const;

    std::optional<AppError> LastError() const;

    void SetErrorHandler(const ErrorHandler &handler) { errorHandler = handler; }
    void SetPostureAlertHandler(const PostureAlertHandler &handler) { alertHandler = handler; }

    /// @brief Latency of the recording ticks
    const Timer &TickTimer() const { return tickTimer; }
};
