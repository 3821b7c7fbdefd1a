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

#include "DlContainer/IDlContainer.hpp"
#include "SNPE/SNPE.hpp"

namespace SnpeUtil
{
    std::unique_ptr<zdl::DlContainer::IDlContainer> loadContainerFromBuffer(const uint8_t *buffer, const size_t size);

    /// @brief Tensor holding the feature vector for a network with a single input
    /// @exception std::runtime_error when the network input does not match the number of features
    std::unique_ptr<zdl::DlSystem::ITensor> loadInputTensor(std::unique_ptr<zdl::SNPE::SNPE> &snpe,
                                                            const std::vector<float> &features);

    /// @brief Copy of the named output tensor
    /// @exception std::runtime_error when the tensor is not in the map
    std::vector<float> readOutputTensor(const zdl::DlSystem::TensorMap &tensorMap, const std::string &name);
}
