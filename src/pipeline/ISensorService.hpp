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

/// @brief External sensor feeding the orchestrator (body tracker, motion or pedometer service)
class ISensorService
{
public:
    virtual ~ISensorService(){};

    virtual std::string Name() const = 0;

    /// @retval false when the sensor is not available on this device
    virtual bool Start() = 0;
    virtual void Stop() = 0;
};
