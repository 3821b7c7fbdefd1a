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
#include <string>
#include <vector>

#include "SNPE/SNPE.hpp"
#include "inference/IInferenceModel.hpp"

/// @brief Tabular model executed by SNPE
class SnpeInferenceModel : public IInferenceModel
{
private:
    std::unique_ptr<zdl::SNPE::SNPE> network;
    std::vector<std::string> outputNames;
    bool isNetworkReady;

public:
    SnpeInferenceModel() : isNetworkReady(false){};
    ~SnpeInferenceModel(){};

    bool CreateNetwork(const uint8_t *buffer, const size_t size, const std::vector<std::string> &runtimes,
                       const std::vector<std::string> &outputNames);

    ModelOutputs Predict(const std::vector<float> &features) override;
};
