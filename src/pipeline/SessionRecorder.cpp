/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SessionRecorder.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

std::string ToString(const RecorderState state)
{
    switch (state)
    {
    case RecorderState::Idle:
        return "idle";
    case RecorderState::Calibrating:
        return "calibrating";
    case RecorderState::Recording:
        return "recording";
    case RecorderState::Paused:
        return "paused";
    case RecorderState::Finished:
        return "finished";
    }
    return "idle";
}

SessionRecorder::Clock SessionRecorder::SteadyClock()
{
    return []() {
        const auto now = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    };
}

SessionRecorder::SessionRecorder(const size_t capacity, const Clock &clock)
    : clock(clock), state(RecorderState::Idle), frames(capacity), motionSamples(capacity), pausedDuration(0.0)
{
}

void SessionRecorder::clear()
{
    frames.Clear();
    motionSamples.Clear();
    steps.clear();
    recordingStartTime.reset();
    pauseStartTime.reset();
    stopTime.reset();
    pausedDuration = 0.0;
}

double SessionRecorder::elapsed() const
{
    if (!recordingStartTime) return 0.0;

    const double end = stopTime ? *stopTime : clock();
    double paused = pausedDuration;
    if (pauseStartTime) paused += end - *pauseStartTime;
    return std::max(0.0, end - *recordingStartTime - paused);
}

bool SessionRecorder::StartCalibration()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (state != RecorderState::Idle) return false;

    clear();
    state = RecorderState::Calibrating;
    return true;
}

bool SessionRecorder::StartRecording()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (state != RecorderState::Calibrating && state != RecorderState::Idle) return false;

    if (state == RecorderState::Idle) clear();
    recordingStartTime = clock();
    state = RecorderState::Recording;
    std::cout << "Recording started" << std::endl;
    return true;
}

bool SessionRecorder::Pause()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (state != RecorderState::Recording) return false;

    pauseStartTime = clock();
    state = RecorderState::Paused;
    return true;
}

bool SessionRecorder::Resume()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (state != RecorderState::Paused) return false;

    if (pauseStartTime) pausedDuration += clock() - *pauseStartTime;
    pauseStartTime.reset();
    state = RecorderState::Recording;
    return true;
}

bool SessionRecorder::Stop()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (state != RecorderState::Recording && state != RecorderState::Paused) return false;

    const double now = clock();
    if (pauseStartTime)
    {
        pausedDuration += now - *pauseStartTime;
        pauseStartTime.reset();
    }
    stopTime = now;
    state = RecorderState::Finished;
    std::cout << "Recording stopped: " << frames.Size() << " frames, " << steps.size() << " steps" << std::endl;
    return true;
}

void SessionRecorder::Cancel()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (state != RecorderState::Idle) std::cout << "Recording cancelled in state " << ToString(state) << std::endl;
    clear();
    state = RecorderState::Idle;
}

void SessionRecorder::Reset()
{
    std::lock_guard<std::mutex> lock(mutex);
    clear();
    state = RecorderState::Idle;
}

void SessionRecorder::RecordFrame(const BodyFrame &frame)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (state != RecorderState::Recording) return;

    if (frames.Append(frame))
    {
        std::cout << "Frame buffer decimated to " << frames.Size() << " frames" << std::endl;
    }
}

void SessionRecorder::RecordStep(const StepEvent &step)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (state != RecorderState::Recording) return;
    steps.push_back(step);
}

void SessionRecorder::RecordMotion(const MotionSample &sample)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (state != RecorderState::Recording) return;

    if (motionSamples.Append(sample))
    {
        std::cout << "Motion buffer decimated to " << motionSamples.Size() << " samples" << std::endl;
    }
}

RecorderState SessionRecorder::State() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return state;
}

double SessionRecorder::ElapsedTime() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return elapsed();
}

std::vector<BodyFrame> SessionRecorder::Frames() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return frames.Items();
}

std::vector<StepEvent> SessionRecorder::Steps() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return steps;
}

std::vector<MotionSample> SessionRecorder::MotionSamples() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return motionSamples.Items();
}

size_t SessionRecorder::FrameCount() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return frames.Size();
}

RecorderSnapshot SessionRecorder::Snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex);

    RecorderSnapshot snapshot;
    snapshot.state = state;
    snapshot.elapsedSec = elapsed();
    snapshot.frameCount = frames.Size();
    snapshot.stepCount = steps.size();
    snapshot.motionSampleCount = motionSamples.Size();
    if (!frames.Empty()) snapshot.latestFrame = frames.Back();
    return snapshot;
}
