/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>

#include "inference/IModelProvider.hpp"

/// @brief Caches loaded models. A model that failed to load is not tried again.
class ModelProvider : public IModelProvider
{
private:
    bool isEnabled;
    std::mutex mutex;
    std::map<ModelId, std::shared_ptr<IInferenceModel>> loadedModels;
    std::set<ModelId> failedModels;

protected:
    /// @retval nullptr on failure, the cause is logged by the implementation
    virtual std::shared_ptr<IInferenceModel> createModel(const ModelId id) = 0;

public:
    explicit ModelProvider(const bool isEnabled) : isEnabled(isEnabled){};
    virtual ~ModelProvider(){};

    bool IsEnabled() const override { return isEnabled; }
    void SetEnabled(const bool enabled) { isEnabled = enabled; }

    std::shared_ptr<IInferenceModel> LoadModel(const ModelId id) override;

    bool HasFailed(const ModelId id);
};
