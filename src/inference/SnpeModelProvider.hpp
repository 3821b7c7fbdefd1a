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
#include <vector>

#include "inference/ModelProvider.hpp"

/// @brief Loads <modelDir>/<ModelName>.dlc with SNPE
class SnpeModelProvider : public ModelProvider
{
private:
    std::string modelDir;
    std::vector<std::string> runtimes;

    static bool readFile(const std::string &path, std::vector<uint8_t> &buffer);

protected:
    std::shared_ptr<IInferenceModel> createModel(const ModelId id) override;

public:
    SnpeModelProvider(const std::string &modelDir, const std::vector<std::string> &runtimes, const bool isEnabled)
        : ModelProvider(isEnabled), modelDir(modelDir), runtimes(runtimes){};
    ~SnpeModelProvider(){};

    std::string ModelPath(const ModelId id) const;
};
