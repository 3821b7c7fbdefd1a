/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "InferencePaths.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "MathUtil.hpp"
#include "inference/FeatureVector.hpp"
#include "inference/ModelCatalog.hpp"

namespace
{
    const std::vector<std::string> POSTURE_FACTORS = {"cva",      "sva",    "trunk",    "lateral", "shoulder",
                                                      "kyphosis", "pelvic", "lordosis", "coronal"};

    const std::vector<float> &requireOutput(const ModelOutputs &outputs, const ModelId id, const size_t minimumSize)
    {
        const std::string name = ModelCatalog::OutputName(id);
        const auto it = outputs.find(name);
        if (it == outputs.end()) throw std::runtime_error("Output " + name + " was not found");
        if (it->second.size() < minimumSize) throw std::runtime_error("Output " + name + " is too short");
        for (const float value : it->second)
        {
            if (!std::isfinite(value)) throw std::runtime_error("Output " + name + " has a non-finite value");
        }
        return it->second;
    }
}

std::optional<GaitPatternResult> InferencePaths::PredictGaitPattern(IInferenceModel &model,
                                                                    const GaitPatternInput &input,
                                                                    const GaitPatternResult &ruleResult)
{
    const ModelId id = ModelId::GaitPatternClassifier;
    const std::optional<FeatureVector> features = FeatureVector::Create(input.Features(), ModelCatalog::FeatureCount(id));
    if (!features) return std::nullopt;

    const ModelOutputs outputs = model.Predict(features->Values());
    const std::vector<float> &probabilities = requireOutput(outputs, id, 1);

    GaitPatternResult result;
    const auto &patterns = ClinicalTypeUtil::AllGaitPatterns();
    for (size_t i = 0; i < patterns.size(); i++)
    {
        // classes the model does not emit count as 0
        result.patternScores[patterns[i]] = i < probabilities.size() ? probabilities[i] : 0.0;
    }
    result.primaryPattern = GaitPatternClassifier::ArgMax(result.patternScores);
    result.confidence = result.patternScores[result.primaryPattern];
    result.flags = ruleResult.flags;
    return result;
}

std::optional<PostureScore> InferencePaths::PredictPostureScore(IInferenceModel &model, const PostureScore &ruleResult)
{
    const ModelId id = ModelId::PostureScorer;

    std::vector<std::optional<double>> values;
    for (const std::string &factor : POSTURE_FACTORS)
    {
        const auto it = ruleResult.subScores.find(factor);
        values.push_back(it == ruleResult.subScores.end() ? std::nullopt : std::optional<double>(it->second));
    }
    const std::optional<FeatureVector> features = FeatureVector::Create(values, ModelCatalog::FeatureCount(id));
    if (!features) return std::nullopt;

    const ModelOutputs outputs = model.Predict(features->Values());
    const std::vector<float> &score = requireOutput(outputs, id, 1);

    PostureScore result = ruleResult;
    result.compositeScore = MathUtil::Clamp(static_cast<double>(score[0]), 0.0, 100.0);
    return result;
}

std::optional<FallRiskAssessment> InferencePaths::PredictFallRisk(IInferenceModel &model, const FallRiskInput &input,
                                                                  const FallRiskAssessment &ruleResult)
{
    const ModelId id = ModelId::FallRiskPredictor;
    const std::vector<std::optional<double>> values = {
        input.walkingSpeedMPS,      input.strideTimeCVPercent, input.doubleSupportPercent,
        input.stepWidthVariabilityCm, input.swayVelocityMMS,   input.stepAsymmetryPercent,
        input.tugTimeSec,           input.footClearanceM,
    };
    const std::optional<FeatureVector> features = FeatureVector::Create(values, ModelCatalog::FeatureCount(id));
    if (!features) return std::nullopt;

    const ModelOutputs outputs = model.Predict(features->Values());
    const std::vector<float> &score = requireOutput(outputs, id, 1);

    FallRiskAssessment result = ruleResult;
    result.compositeScore = MathUtil::Clamp(static_cast<double>(score[0]), 0.0, 100.0);
    result.riskLevel = FallRiskAnalyzer::Level(result.compositeScore, ruleResult.riskFactorCount);
    return result;
}
