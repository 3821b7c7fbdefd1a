/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pipeline/ISessionSink.hpp"

/// @brief Writes <name>.json (summary and analysis) and three CBOR blobs beside it.
/// The name is "session_" followed by the start time in milliseconds.
class JsonFileSessionSink : public ISessionSink
{
private:
    std::string outputDir;
    std::string lastPath;

    static bool writeFile(const std::string &path, const std::vector<uint8_t> &data);

public:
    explicit JsonFileSessionSink(const std::string &outputDir) : outputDir(outputDir){};
    ~JsonFileSessionSink(){};

    bool Save(const SessionRecord &record) override;

    /// @brief Summary file written by the last successful Save
    const std::string &LastPath() const { return lastPath; }
};
