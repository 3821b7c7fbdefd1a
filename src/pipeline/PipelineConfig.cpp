/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "PipelineConfig.hpp"

#include <fstream>
#include <iostream>

namespace
{
    int positive(const int value, const int fallback) { return value > 0 ? value : fallback; }
}

PipelineConfig PipelineConfig::FromJson(const nlohmann::json &json)
{
    PipelineConfig config;
    if (!json.is_object()) return config;

    if (json.contains("throttle") && json["throttle"].is_object())
    {
        const nlohmann::json &throttle = json["throttle"];
        config.throttle.rom = positive(throttle.value("rom", config.throttle.rom), config.throttle.rom);
        config.throttle.balance = positive(throttle.value("balance", config.throttle.balance), config.throttle.balance);
        config.throttle.ergonomics =
            positive(throttle.value("ergonomics", config.throttle.ergonomics), config.throttle.ergonomics);
        config.throttle.fatigue = positive(throttle.value("fatigue", config.throttle.fatigue), config.throttle.fatigue);
    }

    config.calibrationSeconds = json.value("calibrationSeconds", config.calibrationSeconds);
    config.recorderCapacity = json.value("recorderCapacity", config.recorderCapacity);

    if (json.contains("postureAlert") && json["postureAlert"].is_object())
    {
        const nlohmann::json &alert = json["postureAlert"];
        config.postureAlert.threshold = alert.value("threshold", config.postureAlert.threshold);
        config.postureAlert.cooldownTicks = alert.value("cooldownTicks", config.postureAlert.cooldownTicks);
    }

    if (json.contains("inference") && json["inference"].is_object())
    {
        const nlohmann::json &inference = json["inference"];
        config.inference.enabled = inference.value("enabled", config.inference.enabled);
        config.inference.modelDir = inference.value("modelDir", config.inference.modelDir);
        config.inference.runtimes = inference.value("runtimes", config.inference.runtimes);
    }

    if (json.contains("profile") && json["profile"].is_object())
    {
        const nlohmann::json &profile = json["profile"];
        if (profile.contains("ageYears") && profile["ageYears"].is_number())
        {
            config.profile.ageYears = profile["ageYears"].get<int>();
        }
        BiologicalSex sex;
        if (ClinicalTypeUtil::FromString(profile.value("sex", std::string()), sex)) config.profile.sex = sex;
        config.profile.heightM = profile.value("heightM", config.profile.heightM);
        if (profile.contains("weightKg") && profile["weightKg"].is_number())
        {
            config.profile.weightKg = profile["weightKg"].get<double>();
        }
        config.profile.weightLossSelfReport = profile.value("weightLossSelfReport", false);
        if (profile.contains("dailyStepCount") && profile["dailyStepCount"].is_number())
        {
            config.profile.dailyStepCount = profile["dailyStepCount"].get<double>();
        }
    }

    if (config.recorderCapacity < 4)
    {
        std::cerr << "recorderCapacity " << config.recorderCapacity << " is too small, using 36000" << std::endl;
        config.recorderCapacity = 36000;
    }
    return config;
}

bool PipelineConfig::Load(const std::string &path, PipelineConfig &config)
{
    std::ifstream file(path);
    if (!file)
    {
        std::cerr << "Config file was not found: " << path << std::endl;
        return false;
    }

    try
    {
        const nlohmann::json json = nlohmann::json::parse(file);
        config = FromJson(json);
    }
    catch (const nlohmann::json::exception &e)
    {
        std::cerr << "Malformed config " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}
