/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SnpeInferenceModel.hpp"

#include <iostream>
#include <stdexcept>

#include "SNPE/SNPEBuilder.hpp"
#include "inference/SnpeUtil.hpp"

bool SnpeInferenceModel::CreateNetwork(const uint8_t *buffer, const size_t size,
                                       const std::vector<std::string> &runtimes,
                                       const std::vector<std::string> &outputNames)
{
    if (buffer == nullptr)
    {
        std::cout << "Dlc data was not found/valid." << std::endl;
        return false;
    }

    if (runtimes.empty())
    {
        std::cout << "Runtime was not specified" << std::endl;
        return false;
    }

    zdl::DlSystem::RuntimeList runtimeList;
    for (const std::string &runtime_str : runtimes)
    {
        const zdl::DlSystem::Runtime_t runtime = zdl::DlSystem::RuntimeList::stringToRuntime(runtime_str.c_str());
        if (runtime == zdl::DlSystem::Runtime_t::UNSET)
        {
            std::cout << "Unknown runtime: " << runtime_str << std::endl;
            return false;
        }
        runtimeList.add(runtime);
    }

    zdl::DlSystem::StringList outputTensorNames;
    for (const std::string &name : outputNames) outputTensorNames.append(name.c_str());

    // Create SNPE object
    const zdl::DlSystem::PlatformConfig platformConfig;
    std::unique_ptr<zdl::DlContainer::IDlContainer> container = SnpeUtil::loadContainerFromBuffer(buffer, size);
    if (container == nullptr)
    {
        std::cerr << "Error while opening the container" << std::endl;
        return false;
    }

    zdl::SNPE::SNPEBuilder snpeBuilder(container.get());
    network = snpeBuilder.setOutputTensors(outputTensorNames)
                  .setRuntimeProcessorOrder(runtimeList)
                  .setUseUserSuppliedBuffers(false)
                  .setPlatformConfig(platformConfig)
                  .setInitCacheMode(false)
                  .setPerformanceProfile(zdl::DlSystem::PerformanceProfile_t::BALANCED)
                  .build();

    if (network == nullptr)
    {
        std::cerr << "Error while building SNPE object" << std::endl;
        isNetworkReady = false;
        return false;
    }

    this->outputNames = outputNames;
    isNetworkReady = true;
    return true;
}

ModelOutputs SnpeInferenceModel::Predict(const std::vector<float> &features)
{
    if (!isNetworkReady) throw std::runtime_error("Network is not ready");

    std::unique_ptr<zdl::DlSystem::ITensor> inputTensor = SnpeUtil::loadInputTensor(network, features);
    zdl::DlSystem::TensorMap outputTensors;
    if (!network->execute(inputTensor.get(), outputTensors))
    {
        throw std::runtime_error("Error while executing the network.");
    }

    ModelOutputs outputs;
    for (const std::string &name : outputNames) outputs[name] = SnpeUtil::readOutputTensor(outputTensors, name);
    return outputs;
}
