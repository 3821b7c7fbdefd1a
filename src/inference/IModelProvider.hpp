/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <memory>

#include "inference/IInferenceModel.hpp"
#include "inference/ModelCatalog.hpp"

class IModelProvider
{
public:
    virtual ~IModelProvider(){};

    /// @brief false when the rule based path must always be used
    virtual bool IsEnabled() const = 0;

    /// @retval nullptr when the model cannot be loaded
    virtual std::shared_ptr<IInferenceModel> LoadModel(const ModelId id) = 0;
};
