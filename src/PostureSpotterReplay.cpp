/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <fstream>
#include <gflags/gflags.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "Types.hpp"
#include "inference/SnpeModelProvider.hpp"
#include "pipeline/FrameOrchestrator.hpp"
#include "pipeline/JsonFileSessionSink.hpp"
#include "pipeline/PipelineConfig.hpp"
#include "pipeline/SessionCodec.hpp"
#include "utils/StringUtil.hpp"

// Define and parser command line arguments
DEFINE_string(config, "", "Path to pipeline config JSON file (defaults are used when empty)");
DEFINE_string(input, "session.jsonl", "Path to recorded sensor stream, one JSON object per line");
DEFINE_string(output_dir, "outputs", "Path to output dir");
DEFINE_string(model_dir, "", "Directory of the DLC model files (overrides the config)");
DEFINE_bool(use_inference, false, "Use the SNPE models where available (overrides the config)");
DEFINE_string(runtimes, "", "Comma separated SNPE runtimes, e.g. dsp,gpu,cpu (overrides the config)");

/// @brief Sensor stand-in for a recorded stream. The stream is pushed by main().
class ReplaySensorService : public ISensorService
{
private:
    std::string name;
    bool isRunning;

public:
    explicit ReplaySensorService(const std::string &name) : name(name), isRunning(false){};
    ~ReplaySensorService(){};

    std::string Name() const override { return name; }
    bool Start() override
    {
        isRunning = true;
        return true;
    }
    void Stop() override { isRunning = false; }
    bool IsRunning() const { return isRunning; }
};

bool loadConfig(PipelineConfig &config)
{
    if (!FLAGS_config.empty() && !PipelineConfig::Load(FLAGS_config, config))
    {
        std::cout << "Using default config" << std::endl;
    }

    if (!gflags::GetCommandLineFlagInfoOrDie("use_inference").is_default)
    {
        config.inference.enabled = FLAGS_use_inference;
    }
    if (!FLAGS_model_dir.empty()) config.inference.modelDir = FLAGS_model_dir;
    if (!FLAGS_runtimes.empty())
    {
        const std::vector<std::string> runtimes = StringUtil::Split(FLAGS_runtimes, ',');
        if (runtimes.empty())
        {
            std::cout << "Invalid runtimes: " << FLAGS_runtimes << std::endl;
            return false;
        }
        config.inference.runtimes = runtimes;
    }
    return true;
}

/// @retval false when the line is not a known sensor event
bool dispatchLine(FrameOrchestrator &orchestrator, const std::string &line, double &replayTime)
{
    const nlohmann::json event = nlohmann::json::parse(line);
    const std::string type = event.value("type", std::string());
    const double timestamp = event.at("timestamp").get<double>();
    replayTime = timestamp;

    if (type == "joints")
    {
        orchestrator.OnJointFrame(JointFrame(timestamp, SessionCodec::JointsFromJson(event.at("joints"))));
    }
    else if (type == "motion")
    {
        orchestrator.OnMotionSample(SessionCodec::MotionFromJson(event));
    }
    else if (type == "pedometer")
    {
        PedometerSnapshot snapshot;
        snapshot.timestamp = timestamp;
        snapshot.distanceM = event.value("distanceM", 0.0);
        snapshot.stepCount = event.value("stepCount", 0);
        if (event.contains("cadenceSPM") && event["cadenceSPM"].is_number())
        {
            snapshot.cadenceSPM = event["cadenceSPM"].get<double>();
        }
        snapshot.floorsAscended = event.value("floorsAscended", 0);
        snapshot.floorsDescended = event.value("floorsDescended", 0);
        orchestrator.OnPedometerSnapshot(snapshot);
    }
    else if (type == "tug")
    {
        return orchestrator.RecordTugTime(event.at("seconds").get<double>());
    }
    else
    {
        return false;
    }
    return true;
}

void printSummary(const SessionRecord &record)
{
    const SessionSummary &summary = record.summary;
    std::cout << "Session " << summary.date << ": " << summary.frameCount << " frames, "
              << StringUtil::Fixed(summary.durationSec, 1) << " sec" << std::endl;
    if (summary.postureScore)
    {
        std::cout << "  posture score: " << StringUtil::Fixed(*summary.postureScore, 1) << std::endl;
    }
    if (summary.gaitPattern)
    {
        std::cout << "  gait pattern: " << ClinicalTypeUtil::ToString(summary.gaitPattern->primaryPattern) << " ("
                  << StringUtil::Fixed(summary.gaitPattern->confidence, 2) << ")" << std::endl;
    }
    if (summary.fallRisk)
    {
        std::cout << "  fall risk: " << ClinicalTypeUtil::ToString(summary.fallRisk->riskLevel) << " ("
                  << StringUtil::Fixed(summary.fallRisk->compositeScore, 1) << ")" << std::endl;
    }
    if (summary.distanceM)
    {
        std::cout << "  distance: " << StringUtil::Fixed(*summary.distanceM, 1) << " m ("
                  << DistanceSourceUtil::ToString(summary.distanceSource) << ")" << std::endl;
    }
    std::cout << "  " << record.analysis.overallAssessment << std::endl;
}

int main(int argc, char **argv)
{
    gflags::SetUsageMessage("Offline replay of a recorded posture and gait session.");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    PipelineConfig config;
    if (!loadConfig(config)) return EXIT_FAILURE;

    std::ifstream ifs(FLAGS_input);
    if (!ifs)
    {
        std::cout << "Couldn't open the input file: " << FLAGS_input << std::endl;
        return EXIT_FAILURE;
    }

    // the recorder runs on the stream time so that durations match the recording
    double replayTime = 0.0;
    const SessionRecorder::Clock replayClock = [&replayTime]() { return replayTime; };

    const auto provider = std::make_shared<SnpeModelProvider>(config.inference.modelDir, config.inference.runtimes,
                                                              config.inference.enabled);
    const auto bodyTracker = std::make_shared<ReplaySensorService>("body tracker");
    const auto motionService = std::make_shared<ReplaySensorService>("motion service");
    FrameOrchestrator orchestrator(config, bodyTracker, motionService, provider, replayClock);

    int alerts = 0;
    orchestrator.SetPostureAlertHandler([&alerts](const double) { alerts++; });

    if (!orchestrator.StartCapture())
    {
        std::cout << "Failed to start capture" << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "Replaying " << FLAGS_input << std::endl;
    std::string line;
    int lineNumber = 0;
    int skipped = 0;
    while (std::getline(ifs, line))
    {
        lineNumber++;
        if (line.empty()) continue;
        try
        {
            if (!dispatchLine(orchestrator, line, replayTime)) skipped++;
        }
        catch (const nlohmann::json::exception &e)
        {
            std::cerr << "Line " << lineNumber << " skipped: " << e.what() << std::endl;
            skipped++;
        }
    }
    if (skipped > 0) std::cout << skipped << " of " << lineNumber << " lines skipped" << std::endl;

    if (!orchestrator.StopCapture())
    {
        std::cout << "No data was recorded (state " << ToString(orchestrator.State()) << ")" << std::endl;
        orchestrator.Cancel();
        return EXIT_FAILURE;
    }

    JsonFileSessionSink sink(FLAGS_output_dir);
    const std::optional<SessionRecord> record = orchestrator.SaveSession(sink);
    if (!record)
    {
        std::cout << "Failed to save the session" << std::endl;
        return EXIT_FAILURE;
    }

    printSummary(*record);
    std::cout << "  posture alerts: " << alerts << std::endl;
    return EXIT_SUCCESS;
}
