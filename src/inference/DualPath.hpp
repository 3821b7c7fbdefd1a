/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "inference/IModelProvider.hpp"

enum class ResultPath
{
    RuleBased,
    Inference,
};

/// @brief Runs the rule based path and, when possible, replaces its result with the model prediction.
///
/// The inference function receives the rule result so that explanation fields can be copied from it.
/// It returns std::nullopt when the feature vector cannot be built and may throw on prediction errors.
/// Every failure falls back to the rule result and is logged, the caller always gets a result.
template <class Result>
class DualPath
{
public:
    using RuleFunction = std::function<Result()>;
    using InferenceFunction = std::function<std::optional<Result>(IInferenceModel &model, const Result &ruleResult)>;

private:
    std::shared_ptr<IModelProvider> provider;
    ModelId modelId;

    void logFallback(const std::string &reason) const
    {
        std::cerr << "[" << ModelCatalog::Name(modelId) << "] falling back to rule based result: " << reason
                  << std::endl;
    }

public:
    DualPath(const std::shared_ptr<IModelProvider> &provider, const ModelId modelId)
        : provider(provider), modelId(modelId){};
    ~DualPath(){};

    Result Run(const RuleFunction &rule, const InferenceFunction &inference, ResultPath &path) const
    {
        const Result ruleResult = rule();
        path = ResultPath::RuleBased;

        if (provider == nullptr || !provider->IsEnabled()) return ruleResult;

        const std::shared_ptr<IInferenceModel> model = provider->LoadModel(modelId);
        if (model == nullptr)
        {
            logFallback("model not loadable");
            return ruleResult;
        }

        try
        {
            const std::optional<Result> predicted = inference(*model, ruleResult);
            if (!predicted)
            {
                logFallback("invalid feature vector");
                return ruleResult;
            }
            path = ResultPath::Inference;
            return *predicted;
        }
        catch (const std::exception &e)
        {
            logFallback(e.what());
            return ruleResult;
        }
    }

    Result Run(const RuleFunction &rule, const InferenceFunction &inference) const
    {
        ResultPath path;
        return Run(rule, inference, path);
    }
};
