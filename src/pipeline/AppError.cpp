/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "AppError.hpp"

std::string AppError::ToString() const
{
    std::string name;
    switch (kind)
    {
    case ErrorKind::SensorUnavailable:
        name = "SensorUnavailable";
        break;
    case ErrorKind::PersistenceFailed:
        name = "PersistenceFailed";
        break;
    case ErrorKind::ModelLoadFailed:
        name = "ModelLoadFailed";
        break;
    case ErrorKind::PredictionFailed:
        name = "PredictionFailed";
        break;
    case ErrorKind::InvalidInput:
        name = "InvalidInput";
        break;
    }
    return name + ": " + message;
}
