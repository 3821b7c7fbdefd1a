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
#include <vector>

#include "session/SessionAnalysis.hpp"
#include "session/SessionSummary.hpp"

/// @brief One finalized capture. The time series are CBOR blobs kept out of the summary.
struct SessionRecord
{
    SessionSummary summary;
    SessionAnalysis analysis;

    std::vector<uint8_t> framesBlob;
    std::vector<uint8_t> stepsBlob;
    std::vector<uint8_t> motionBlob;
};
