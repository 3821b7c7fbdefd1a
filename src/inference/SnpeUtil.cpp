/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SnpeUtil.hpp"

#include <algorithm>
#include <stdexcept>

#include "DlSystem/ITensorFactory.hpp"
#include "SNPE/SNPEFactory.hpp"

// This method is based on the SNPE sample: $SNPE_ROOT/examples/SNPE/NativeCpp/SampleCode/jni/LoadContainer.cpp
std::unique_ptr<zdl::DlContainer::IDlContainer> SnpeUtil::loadContainerFromBuffer(const uint8_t *buffer, const size_t size)
{
    std::unique_ptr<zdl::DlContainer::IDlContainer> container;
    container = zdl::DlContainer::IDlContainer::open(buffer, size);
    return container;
}

// This method is based on the SNPE sample: $SNPE_ROOT/examples/SNPE/NativeCpp/SampleCode/jni/LoadInputTensor.cpp
std::unique_ptr<zdl::DlSystem::ITensor> SnpeUtil::loadInputTensor(std::unique_ptr<zdl::SNPE::SNPE> &snpe,
                                                                   const std::vector<float> &features)
{
    const auto &strList_opt = snpe->getInputTensorNames();
    if (!strList_opt) throw std::runtime_error("Error obtaining Input tensor names");
    const auto &strList = *strList_opt;
    if (strList.size() != 1) throw std::runtime_error("Network must have a single input");

    const auto &inputDims_opt = snpe->getInputDimensions(strList.at(0));
    const auto &inputShape = *inputDims_opt;

    std::unique_ptr<zdl::DlSystem::ITensor> input = zdl::SNPE::SNPEFactory::getTensorFactory().createTensor(inputShape);
    if (input == nullptr) throw std::runtime_error("Error while creating the input tensor");

    // the tabular models take a [1, N] input
    if (input->getSize() != features.size())
    {
        throw std::runtime_error("Size of features does not match network input. Expecting: " +
                                 std::to_string(input->getSize()) + ", Got: " + std::to_string(features.size()));
    }

    std::copy(features.begin(), features.end(), input->begin());
    return input;
}

std::vector<float> SnpeUtil::readOutputTensor(const zdl::DlSystem::TensorMap &tensorMap, const std::string &name)
{
    zdl::DlSystem::ITensor *output = tensorMap.getTensor(name.c_str());
    if (output == nullptr) throw std::runtime_error("Output tensor " + name + " was not found");

    return std::vector<float>(output->cbegin(), output->cend());
}
