/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clinical/ClinicalTypes.hpp"

/// @brief Every how many ticks a throttled analyzer runs
struct ThrottleConfig
{
    int rom{3};
    int balance{2};
    int ergonomics{10};
    int fatigue{6};
};

struct PostureAlertConfig
{
    double threshold{50.0};
    int cooldownTicks{120};
};

struct InferenceConfig
{
    bool enabled{false};
    std::string modelDir{"models"};
    std::vector<std::string> runtimes{"cpu"};
};

struct SubjectProfile
{
    std::optional<int> ageYears;
    BiologicalSex sex{BiologicalSex::NotSet};
    double heightM{1.70};
    std::optional<double> weightKg;
    bool weightLossSelfReport{false};
    std::optional<double> dailyStepCount;
};

struct PipelineConfig
{
    ThrottleConfig throttle;
    double calibrationSeconds{3.0};
    size_t recorderCapacity{36000};
    PostureAlertConfig postureAlert;
    InferenceConfig inference;
    SubjectProfile profile;

    /// @brief Missing keys keep their defaults
    static PipelineConfig FromJson(const nlohmann::json &json);

    /// @retval false when the file cannot be read or parsed, config is left untouched
    static bool Load(const std::string &path, PipelineConfig &config);
};
