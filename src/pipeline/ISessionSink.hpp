/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include "pipeline/SessionRecord.hpp"

/// @brief Persistent store of finalized sessions
class ISessionSink
{
public:
    virtual ~ISessionSink(){};

    /// @retval false when the record could not be written. The caller keeps its data for a retry.
    virtual bool Save(const SessionRecord &record) = 0;
};
