/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "ModelProvider.hpp"

#include <iostream>

std::shared_ptr<IInferenceModel> ModelProvider::LoadModel(const ModelId id)
{
    std::lock_guard<std::mutex> lock(mutex);

    const auto it = loadedModels.find(id);
    if (it != loadedModels.end()) return it->second;
    if (failedModels.count(id) > 0) return nullptr;

    std::shared_ptr<IInferenceModel> model = createModel(id);
    if (model == nullptr)
    {
        std::cerr << "Failed to load model " << ModelCatalog::Name(id) << " v" << ModelCatalog::MODEL_VERSION
                  << std::endl;
        failedModels.insert(id);
        return nullptr;
    }

    std::cout << "Loaded model " << ModelCatalog::Name(id) << " v" << ModelCatalog::MODEL_VERSION << std::endl;
    loadedModels[id] = model;
    return model;
}

bool ModelProvider::HasFailed(const ModelId id)
{
    std::lock_guard<std::mutex> lock(mutex);
    return failedModels.count(id) > 0;
}
