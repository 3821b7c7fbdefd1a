/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <functional>
#include <string>

enum class ErrorKind
{
    SensorUnavailable,
    PersistenceFailed,
    ModelLoadFailed,
    PredictionFailed,
    InvalidInput,
};

/// @brief Error reported to the caller through the error channel, never thrown
struct AppError
{
    ErrorKind kind;
    std::string message;

    std::string ToString() const;
};

using ErrorHandler = std::function<void(const AppError &error)>;
