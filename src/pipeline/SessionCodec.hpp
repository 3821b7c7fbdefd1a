/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "Types.hpp"
#include "pipeline/SessionRecord.hpp"

/// @brief JSON form of the summary and CBOR encoding of the recorded time series
namespace SessionCodec
{
    nlohmann::json SummaryToJson(const SessionSummary &summary);
    nlohmann::json AnalysisToJson(const SessionAnalysis &analysis);

    std::vector<uint8_t> EncodeFrames(const std::vector<BodyFrame> &frames);
    std::vector<uint8_t> EncodeSteps(const std::vector<StepEvent> &steps);
    std::vector<uint8_t> EncodeMotion(const std::vector<MotionSample> &samples);

    /// @retval false when the blob is not a valid encoding, frames is left empty
    bool DecodeFrames(const std::vector<uint8_t> &blob, std::vector<BodyFrame> &frames);
    bool DecodeSteps(const std::vector<uint8_t> &blob, std::vector<StepEvent> &steps);
    bool DecodeMotion(const std::vector<uint8_t> &blob, std::vector<MotionSample> &samples);

    /// @brief Motion sample from {"timestamp", "attitude", "userAcceleration", "gravity", "rotationRate"}
    /// @throw nlohmann::json::exception when a field is missing or has the wrong type
    MotionSample MotionFromJson(const nlohmann::json &json);

    /// @brief Joint map as {"root": [x, y, z], ...}. Unknown keys are skipped when parsing.
    nlohmann::json JointsToJson(const JointMap &joints);
    JointMap JointsFromJson(const nlohmann::json &json);
}
