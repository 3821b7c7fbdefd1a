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
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"
#include "pipeline/DecimatingBuffer.hpp"

enum class RecorderState
{
    Idle,
    Calibrating,
    Recording,
    Paused,
    Finished,
};

std::string ToString(const RecorderState state);

/// @brief Consistent copy of the recorder taken under its lock
struct RecorderSnapshot
{
    RecorderState state{RecorderState::Idle};
    double elapsedSec{0.0};
    size_t frameCount{0};
    size_t stepCount{0};
    size_t motionSampleCount{0};
    std::optional<BodyFrame> latestFrame;
};

/// @brief Capture state machine and bounded buffers of the recorded session.
///
/// idle -> calibrating -> recording <-> paused -> finished -> idle.
/// Data is only accepted while recording. Appends and reads are serialized by one mutex.
class SessionRecorder
{
public:
    /// @brief Monotonic seconds
    using Clock = std::function<double()>;

    static Clock SteadyClock();

private:
    mutable std::mutex mutex;
    Clock clock;
    RecorderState state;

    DecimatingBuffer<BodyFrame> frames;
    DecimatingBuffer<MotionSample> motionSamples;
    std::vector<StepEvent> steps;

    std::optional<double> recordingStartTime;
    std::optional<double> pauseStartTime;
    std::optional<double> stopTime;
    double pausedDuration;

    void clear();
    double elapsed() const;

public:
    explicit SessionRecorder(const size_t capacity = 36000, const Clock &clock = SteadyClock());
    ~SessionRecorder(){};

    /// @brief idle -> calibrating
    bool StartCalibration();

    /// @brief calibrating or idle -> recording
    bool StartRecording();

    bool Pause();
    bool Resume();

    /// @brief recording or paused -> finished
    bool Stop();

    /// @brief Any state -> idle. Buffered data is discarded.
    void Cancel();

    /// @brief finished (or any state) -> idle after the session was saved
    void Reset();

    void RecordFrame(const BodyFrame &frame);
    void RecordStep(const StepEvent &step);
    void RecordMotion(const MotionSample &sample);

    RecorderState State() const;

    /// @brief Recording time without the paused intervals
    double ElapsedTime() const;

    std::vector<BodyFrame> Frames() const;
    std::vector<StepEvent> Steps() const;
    std::vector<MotionSample> MotionSamples() const;
    size_t FrameCount() const;

    RecorderSnapshot Snapshot() const;
};
