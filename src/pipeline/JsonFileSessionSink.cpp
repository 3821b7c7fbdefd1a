/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "JsonFileSessionSink.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "pipeline/SessionCodec.hpp"

bool JsonFileSessionSink::writeFile(const std::string &path, const std::vector<uint8_t> &data)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        std::cerr << "Failed to open " << path << std::endl;
        return false;
    }
    ofs.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!ofs)
    {
        std::cerr << "Failed to write " << path << std::endl;
        return false;
    }
    return true;
}

bool JsonFileSessionSink::Save(const SessionRecord &record)
{
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec)
    {
        std::cerr << "Failed to create " << outputDir << ": " << ec.message() << std::endl;
        return false;
    }

    const long long startMs = static_cast<long long>(record.summary.startTimestamp * 1000.0);
    const std::string base = (std::filesystem::path(outputDir) / ("session_" + std::to_string(startMs))).string();

    nlohmann::json document;
    document["summary"] = SessionCodec::SummaryToJson(record.summary);
    document["analysis"] = SessionCodec::AnalysisToJson(record.analysis);
    document["blobs"] = {{"frames", base + "_frames.cbor"},
                         {"steps", base + "_steps.cbor"},
                         {"motion", base + "_motion.cbor"}};

    // blobs first so that a summary never points to missing files
    if (!writeFile(base + "_frames.cbor", record.framesBlob)) return false;
    if (!writeFile(base + "_steps.cbor", record.stepsBlob)) return false;
    if (!writeFile(base + "_motion.cbor", record.motionBlob)) return false;

    const std::string text = document.dump(2);
    if (!writeFile(base + ".json", std::vector<uint8_t>(text.begin(), text.end()))) return false;

    lastPath = base + ".json";
    std::cout << "Session saved to " << lastPath << std::endl;
    return true;
}
