/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SnpeModelProvider.hpp"

#include <sys/stat.h>

#include <fstream>
#include <iostream>

#include "inference/SnpeInferenceModel.hpp"

bool SnpeModelProvider::readFile(const std::string &path, std::vector<uint8_t> &buffer)
{
    struct stat fileStat;
    if (stat(path.c_str(), &fileStat) != 0 || fileStat.st_size <= 0)
    {
        std::cerr << "Model file was not found: " << path << std::endl;
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        std::cerr << "Failed to open model file: " << path << std::endl;
        return false;
    }

    buffer.resize(static_cast<size_t>(fileStat.st_size));
    file.read(reinterpret_cast<char *>(buffer.data()), fileStat.st_size);
    if (!file)
    {
        std::cerr << "Failed to read model file: " << path << std::endl;
        return false;
    }
    return true;
}

std::string SnpeModelProvider::ModelPath(const ModelId id) const
{
    return modelDir + "/" + ModelCatalog::Name(id) + ".dlc";
}

std::shared_ptr<IInferenceModel> SnpeModelProvider::createModel(const ModelId id)
{
    std::vector<uint8_t> buffer;
    if (!readFile(ModelPath(id), buffer)) return nullptr;

    std::shared_ptr<SnpeInferenceModel> model = std::make_shared<SnpeInferenceModel>();
    if (!model->CreateNetwork(buffer.data(), buffer.size(), runtimes, {ModelCatalog::OutputName(id)})) return nullptr;
    return model;
}
