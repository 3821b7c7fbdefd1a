/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <memory>
#include <thread>
#include <vector>

#include "TestHelpers.hpp"
#include "pipeline/FrameOrchestrator.hpp"

namespace
{
    struct Fixture
    {
        std::shared_ptr<FakeSensorService> bodyTracker;
        std::shared_ptr<FakeSensorService> motionService;
        ManualClock clock;
        std::vector<AppError> errors;
        std::vector<double> alerts;
        std::unique_ptr<FrameOrchestrator> orchestrator;

        explicit Fixture(const PipelineConfig &config = immediateConfig(), const bool trackerAvailable = true,
                         const bool motionAvailable = true)
            : bodyTracker(std::make_shared<FakeSensorService>("body tracker", trackerAvailable)),
              motionService(std::make_shared<FakeSensorService>("motion", motionAvailable))
        {
            orchestrator = std::make_unique<FrameOrchestrator>(config, bodyTracker, motionService, nullptr,
                                                               clock.Clock());
            orchestrator->SetErrorHandler([this](const AppError &error) { errors.push_back(error); });
            orchestrator->SetPostureAlertHandler([this](const double score) { alerts.push_back(score); });
        }

        static PipelineConfig immediateConfig()
        {
            PipelineConfig config;
            config.calibrationSeconds = 0.0;
            return config;
        }

        void feed(const std::vector<JointFrame> &frames)
        {
            for (const JointFrame &frame : frames)
            {
                orchestrator->OnJointFrame(frame);
                clock.Set(frame.timestamp);
            }
        }

        void feedStanding(const int count, const SpineShape &shape = SpineShape())
        {
            for (int i = 0; i < count; i++) orchestrator->OnJointFrame(TestSkeleton::StandingFrame(i / 30.0, shape));
        }
    };
}

TEST(FrameOrchestratorTest, StartFailsWhenTheBodyTrackerIsUnavailable)
{
    Fixture fixture(Fixture::immediateConfig(), false);

    EXPECT_FALSE(fixture.orchestrator->StartCapture());
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Idle);
    ASSERT_EQ(fixture.errors.size(), 1u);
    EXPECT_EQ(fixture.errors[0].kind, ErrorKind::SensorUnavailable);
    ASSERT_TRUE(fixture.orchestrator->LastError().has_value());
    EXPECT_EQ(fixture.orchestrator->LastError()->kind, ErrorKind::SensorUnavailable);
}

TEST(FrameOrchestratorTest, OnlyOneCaptureAtATime)
{
    Fixture fixture;
    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Recording);
    EXPECT_FALSE(fixture.orchestrator->StartCapture());
    EXPECT_EQ(fixture.bodyTracker->startCount, 1);
    EXPECT_EQ(fixture.motionService->startCount, 1);
}

TEST(FrameOrchestratorTest, CalibrationCountdown)
{
    PipelineConfig config;
    config.calibrationSeconds = 2.0;
    Fixture fixture(config);

    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Calibrating);
    EXPECT_EQ(fixture.orchestrator->Countdown(), std::optional<int>(2));
    EXPECT_EQ(fixture.motionService->startCount, 0);

    fixture.orchestrator->OnJointFrame(TestSkeleton::StandingFrame(10.0));
    EXPECT_EQ(fixture.orchestrator->Countdown(), std::optional<int>(2));
    fixture.orchestrator->OnJointFrame(TestSkeleton::StandingFrame(11.5));
    EXPECT_EQ(fixture.orchestrator->Countdown(), std::optional<int>(1));
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Calibrating);

    // the frame completing the calibration is not recorded
    fixture.orchestrator->OnJointFrame(TestSkeleton::StandingFrame(12.0));
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Recording);
    EXPECT_FALSE(fixture.orchestrator->Countdown().has_value());
    EXPECT_EQ(fixture.orchestrator->RecorderStatus().frameCount, 0u);
    EXPECT_EQ(fixture.motionService->startCount, 1);

    fixture.orchestrator->OnJointFrame(TestSkeleton::StandingFrame(12.1));
    EXPECT_EQ(fixture.orchestrator->RecorderStatus().frameCount, 1u);
}

TEST(FrameOrchestratorTest, CaptureContinuesWithoutMotionService)
{
    Fixture fixture(Fixture::immediateConfig(), true, false);

    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Recording);
    ASSERT_EQ(fixture.errors.size(), 1u);
    EXPECT_EQ(fixture.errors[0].kind, ErrorKind::SensorUnavailable);

    fixture.feedStanding(3);
    EXPECT_EQ(fixture.orchestrator->RecorderStatus().frameCount, 3u);
}

TEST(FrameOrchestratorTest, ThrottledAnalyzersKeepTheirLastValue)
{
    Fixture fixture;
    ASSERT_TRUE(fixture.orchestrator->StartCapture());

    fixture.feedStanding(1);
    LiveMetrics live = fixture.orchestrator->LiveSnapshot();
    EXPECT_EQ(live.frameIndex, 1);
    EXPECT_TRUE(live.posture.has_value());
    EXPECT_FALSE(live.balance.has_value());
    EXPECT_FALSE(live.rom.has_value());
    EXPECT_FALSE(live.reba.has_value());

    fixture.feedStanding(1);
    live = fixture.orchestrator->LiveSnapshot();
    EXPECT_TRUE(live.balance.has_value());
    EXPECT_FALSE(live.rom.has_value());

    fixture.feedStanding(1);
    live = fixture.orchestrator->LiveSnapshot();
    EXPECT_TRUE(live.rom.has_value());
    EXPECT_TRUE(live.balance.has_value());
    EXPECT_FALSE(live.reba.has_value());

    fixture.feedStanding(7);
    live = fixture.orchestrator->LiveSnapshot();
    EXPECT_EQ(live.frameIndex, 10);
    ASSERT_TRUE(live.reba.has_value());
    EXPECT_EQ(live.reba->score, 2);

    // every frame is recorded with the cells current at its tick
    const RecorderSnapshot status = fixture.orchestrator->RecorderStatus();
    EXPECT_EQ(status.frameCount, 10u);
    ASSERT_TRUE(status.latestFrame.has_value());
    EXPECT_EQ(status.latestFrame->rebaScore, std::optional<int>(2));
    EXPECT_TRUE(status.latestFrame->posturalType.has_value());
    EXPECT_EQ(fixture.orchestrator->TickTimer().Count(), 10u);
}

TEST(FrameOrchestratorTest, OccludedJointsKeepTheirCachedValues)
{
    PipelineConfig config = Fixture::immediateConfig();
    config.throttle = {1, 1, 1, 1};
    Fixture fixture(config);
    ASSERT_TRUE(fixture.orchestrator->StartCapture());

    fixture.orchestrator->OnJointFrame(TestSkeleton::StandingFrame(0.0));
    const LiveMetrics measured = fixture.orchestrator->LiveSnapshot();
    ASSERT_TRUE(measured.posture.has_value());
    ASSERT_TRUE(measured.rom.has_value());
    ASSERT_TRUE(measured.reba.has_value());
    ASSERT_TRUE(measured.posture->metrics.lumbarLordosisDeg.has_value());
    ASSERT_TRUE(measured.rom->kneeFlexionLeftDeg.has_value());

    JointFrame occluded = TestSkeleton::StandingFrame(1.0 / 30.0);
    occluded.joints.erase(JointName::Spine2);
    occluded.joints.erase(JointName::LeftFoot);
    fixture.orchestrator->OnJointFrame(occluded);

    const LiveMetrics live = fixture.orchestrator->LiveSnapshot();
    ASSERT_TRUE(live.posture.has_value());
    EXPECT_EQ(live.posture->metrics.lumbarLordosisDeg, measured.posture->metrics.lumbarLordosisDeg);
    ASSERT_TRUE(live.rom.has_value());
    EXPECT_EQ(live.rom->kneeFlexionLeftDeg, measured.rom->kneeFlexionLeftDeg);
    EXPECT_EQ(live.rom->kneeFlexionRightDeg, measured.rom->kneeFlexionRightDeg);
    ASSERT_TRUE(live.reba.has_value());
    EXPECT_EQ(live.reba->score, measured.reba->score);
    EXPECT_EQ(live.gait.walkingSpeedMPS, measured.gait.walkingSpeedMPS);
    EXPECT_FALSE(live.gait.stepDetected.has_value());

    const RecorderSnapshot status = fixture.orchestrator->RecorderStatus();
    EXPECT_EQ(status.frameCount, 2u);
    ASSERT_TRUE(status.latestFrame.has_value());
    ASSERT_TRUE(status.latestFrame->lumbarLordosisDeg.has_value());
    EXPECT_NEAR(*status.latestFrame->lumbarLordosisDeg, 45.0, 1e-6);
    EXPECT_EQ(status.latestFrame->kneeFlexionLeftDeg, measured.rom->kneeFlexionLeftDeg);
    EXPECT_EQ(status.latestFrame->rebaScore, std::optional<int>(measured.reba->score));
}

TEST(FrameOrchestratorTest, CancelWhileFramesArrive)
{
    Fixture fixture;
    ASSERT_TRUE(fixture.orchestrator->StartCapture());

    std::atomic<bool> running(true);
    std::thread tracker([&fixture, &running]() {
        int tick = 0;
        while (running)
        {
            fixture.orchestrator->OnJointFrame(TestSkeleton::StandingFrame(tick / 30.0));
            tick++;
        }
    });

    for (int i = 0; i < 50; i++)
    {
        fixture.orchestrator->Cancel();
        fixture.orchestrator->StartCapture();
        std::this_thread::yield();
    }
    fixture.orchestrator->Cancel();
    running = false;
    tracker.join();

    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Idle);
    EXPECT_EQ(fixture.orchestrator->RecorderStatus().frameCount, 0u);
    EXPECT_FALSE(fixture.orchestrator->LiveSnapshot().posture.has_value());
    EXPECT_TRUE(fixture.errors.empty());

    // a fresh capture starts from the first tick
    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    fixture.feedStanding(1);
    EXPECT_EQ(fixture.orchestrator->LiveSnapshot().frameIndex, 1);
}

TEST(FrameOrchestratorTest, PostureAlertRespectsTheCooldown)
{
    PipelineConfig config = Fixture::immediateConfig();
    config.postureAlert.cooldownTicks = 5;
    Fixture fixture(config);
    ASSERT_TRUE(fixture.orchestrator->StartCapture());

    fixture.feedStanding(12, TestSkeleton::Slouched());
    // ticks 1, 6 and 11
    ASSERT_EQ(fixture.alerts.size(), 3u);
    EXPECT_LT(fixture.alerts[0], 50.0);
}

TEST(FrameOrchestratorTest, GoodPostureRaisesNoAlert)
{
    Fixture fixture;
    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    fixture.feedStanding(30);
    EXPECT_TRUE(fixture.alerts.empty());
}

TEST(FrameOrchestratorTest, PausedFramesAreNotRecorded)
{
    Fixture fixture;
    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    fixture.feedStanding(2);

    ASSERT_TRUE(fixture.orchestrator->TogglePause());
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Paused);
    fixture.feedStanding(5);
    fixture.orchestrator->OnMotionSample(MotionSample());
    EXPECT_EQ(fixture.orchestrator->RecorderStatus().frameCount, 2u);
    EXPECT_EQ(fixture.orchestrator->RecorderStatus().motionSampleCount, 0u);

    ASSERT_TRUE(fixture.orchestrator->TogglePause());
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Recording);
    fixture.feedStanding(1);
    EXPECT_EQ(fixture.orchestrator->RecorderStatus().frameCount, 3u);
}

TEST(FrameOrchestratorTest, MotionSamplesAreRecordedWhileRecording)
{
    Fixture fixture;
    fixture.orchestrator->OnMotionSample(MotionSample());
    ASSERT_TRUE(fixture.orchestrator->StartCapture());

    for (int i = 0; i < 6; i++)
    {
        MotionSample sample;
        sample.timestamp = i / 60.0;
        fixture.orchestrator->OnMotionSample(sample);
    }
    fixture.feedStanding(1);

    EXPECT_EQ(fixture.orchestrator->RecorderStatus().motionSampleCount, 6u);
    const LiveMetrics live = fixture.orchestrator->LiveSnapshot();
    ASSERT_TRUE(live.imuCadenceSPM.has_value());
    EXPECT_EQ(*live.imuCadenceSPM, 0.0);
}

TEST(FrameOrchestratorTest, StopAndSaveWalkingSession)
{
    Fixture fixture;
    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    fixture.feed(TestSkeleton::Walk(3.0));

    ASSERT_TRUE(fixture.orchestrator->StopCapture());
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Finished);
    EXPECT_EQ(fixture.bodyTracker->stopCount, 1);
    EXPECT_EQ(fixture.motionService->stopCount, 1);
    EXPECT_FALSE(fixture.orchestrator->StopCapture());

    // frames after the stop are ignored
    fixture.feedStanding(5);
    EXPECT_EQ(fixture.orchestrator->RecorderStatus().frameCount, 91u);

    ASSERT_TRUE(fixture.orchestrator->RecordTugTime(9.5));

    FakeSessionSink sink;
    const std::optional<SessionRecord> record = fixture.orchestrator->SaveSession(sink);
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(sink.saved.size(), 1u);
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Idle);

    const SessionSummary &summary = record->summary;
    EXPECT_EQ(summary.frameCount, 91u);
    EXPECT_NEAR(summary.durationSec, 3.0, 1e-6);
    EXPECT_GT(summary.skeletonStepCount, 0);
    EXPECT_EQ(summary.gait.stepCount, summary.skeletonStepCount);
    ASSERT_TRUE(summary.distanceM.has_value());
    EXPECT_EQ(summary.distanceSource, DistanceSource::BodyTracking);
    EXPECT_NEAR(*summary.distanceM, 3.6, 0.1);
    ASSERT_TRUE(summary.tug.has_value());
    EXPECT_EQ(summary.tug->timeSec, 9.5);
    EXPECT_TRUE(summary.averageCvaDeg.has_value());
    EXPECT_TRUE(summary.rom.has_value());
    EXPECT_FALSE(record->framesBlob.empty());

    // the next session starts clean
    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    EXPECT_EQ(fixture.orchestrator->LiveSnapshot().frameIndex, 0);
    ASSERT_TRUE(fixture.orchestrator->StopCapture());
    const std::optional<SessionRecord> next = fixture.orchestrator->SaveSession(sink);
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(next->summary.tug.has_value());
    EXPECT_EQ(next->summary.frameCount, 0u);
}

TEST(FrameOrchestratorTest, PedometerDistanceTakesPriority)
{
    Fixture fixture;
    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    fixture.feed(TestSkeleton::Walk(1.0));

    PedometerSnapshot snapshot;
    snapshot.distanceM = 42.0;
    snapshot.stepCount = 60;
    fixture.orchestrator->OnPedometerSnapshot(snapshot);
    ASSERT_TRUE(fixture.orchestrator->StopCapture());

    FakeSessionSink sink;
    const std::optional<SessionRecord> record = fixture.orchestrator->SaveSession(sink);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->summary.distanceM, std::optional<double>(42.0));
    EXPECT_EQ(record->summary.distanceSource, DistanceSource::Pedometer);
    EXPECT_EQ(record->summary.pedometerStepCount, std::optional<int>(60));
}

TEST(FrameOrchestratorTest, SaveRequiresAStoppedSession)
{
    Fixture fixture;
    FakeSessionSink sink;

    EXPECT_FALSE(fixture.orchestrator->SaveSession(sink).has_value());
    ASSERT_EQ(fixture.errors.size(), 1u);
    EXPECT_EQ(fixture.errors[0].kind, ErrorKind::InvalidInput);

    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    EXPECT_FALSE(fixture.orchestrator->SaveSession(sink).has_value());
    EXPECT_TRUE(sink.saved.empty());
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Recording);
}

TEST(FrameOrchestratorTest, FailedWriteKeepsTheSessionForRetry)
{
    Fixture fixture;
    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    fixture.feedStanding(10);
    ASSERT_TRUE(fixture.orchestrator->StopCapture());

    FakeSessionSink failing(false);
    EXPECT_FALSE(fixture.orchestrator->SaveSession(failing).has_value());
    ASSERT_EQ(fixture.errors.size(), 1u);
    EXPECT_EQ(fixture.errors[0].kind, ErrorKind::PersistenceFailed);
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Finished);

    FakeSessionSink sink;
    const std::optional<SessionRecord> record = fixture.orchestrator->SaveSession(sink);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->summary.frameCount, 10u);
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Idle);
}

TEST(FrameOrchestratorTest, TugTimeMustBePositive)
{
    Fixture fixture;
    EXPECT_FALSE(fixture.orchestrator->RecordTugTime(0.0));
    EXPECT_FALSE(fixture.orchestrator->RecordTugTime(-3.0));
    EXPECT_FALSE(fixture.orchestrator->RecordTugTime(std::nan("")));
    ASSERT_EQ(fixture.errors.size(), 3u);
    EXPECT_EQ(fixture.errors[0].kind, ErrorKind::InvalidInput);
    EXPECT_EQ(fixture.errors[0].ToString(), "InvalidInput: TUG time must be positive");
    EXPECT_TRUE(fixture.orchestrator->RecordTugTime(11.0));
}

TEST(FrameOrchestratorTest, CancelDiscardsTheCapture)
{
    Fixture fixture;
    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    fixture.feedStanding(5);
    fixture.orchestrator->RecordTugTime(9.0);

    fixture.orchestrator->Cancel();
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Idle);
    EXPECT_EQ(fixture.orchestrator->RecorderStatus().frameCount, 0u);
    EXPECT_EQ(fixture.bodyTracker->stopCount, 1);
    EXPECT_EQ(fixture.motionService->stopCount, 1);
    EXPECT_FALSE(fixture.orchestrator->LiveSnapshot().posture.has_value());

    // the cancelled TUG time does not leak into the next session
    ASSERT_TRUE(fixture.orchestrator->StartCapture());
    ASSERT_TRUE(fixture.orchestrator->StopCapture());
    FakeSessionSink sink;
    const std::optional<SessionRecord> record = fixture.orchestrator->SaveSession(sink);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->summary.tug.has_value());
}

TEST(FrameOrchestratorTest, CancelDuringCalibration)
{
    PipelineConfig config;
    config.calibrationSeconds = 3.0;
    Fixture fixture(config);
    ASSERT_TRUE(fixture.orchestrator->StartCapture());

    fixture.orchestrator->Cancel();
    EXPECT_EQ(fixture.orchestrator->State(), RecorderState::Idle);
    EXPECT_TRUE(fixture.orchestrator->StartCapture());
    EXPECT_EQ(fixture.orchestrator->Countdown(), std::optional<int>(3));
}
