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

#include "analyzers/PostureAnalyzer.hpp"
#include "inference/IInferenceModel.hpp"
#include "session/FallRiskAnalyzer.hpp"
#include "session/GaitPatternClassifier.hpp"

/// @brief Model counterparts of the rule based analyzers, used as the inference side of DualPath.
/// Each returns std::nullopt when the feature vector cannot be built, and throws when the
/// prediction fails or lacks its output tensor.
namespace InferencePaths
{
    /// @brief Class probabilities in GaitPatternType order. Flags are copied from the rule result.
    std::optional<GaitPatternResult> PredictGaitPattern(IInferenceModel &model, const GaitPatternInput &input,
                                                        const GaitPatternResult &ruleResult);

    /// @brief The nine factor sub-scores of the rule result are the features, absent factors use the sentinel
    std::optional<PostureScore> PredictPostureScore(IInferenceModel &model, const PostureScore &ruleResult);

    /// @brief Score clamped to [0, 100]. Factors and their count are copied from the rule result.
    std::optional<FallRiskAssessment> PredictFallRisk(IInferenceModel &model, const FallRiskInput &input,
                                                      const FallRiskAssessment &ruleResult);
}
