/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <string>

enum class ModelId
{
    GaitPatternClassifier,
    PostureScorer,
    FallRiskPredictor,
};

/// @brief Static description of the bundled models
namespace ModelCatalog
{
    const std::string MODEL_VERSION = "1.0.0";

    /// @brief File stem of the DLC, e.g. "GaitPatternClassifier"
    std::string Name(const ModelId id);

    size_t FeatureCount(const ModelId id);

    /// @brief Name of the output tensor read after execution
    std::string OutputName(const ModelId id);
}
