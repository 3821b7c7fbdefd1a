/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SessionSummary.hpp"

std::string DistanceSourceUtil::ToString(const DistanceSource source)
{
    switch (source)
    {
    case DistanceSource::Pedometer:
        return "pedometer";
    case DistanceSource::BodyTracking:
        return "bodyTracking";
    case DistanceSource::StepEstimate:
        return "stepEstimate";
    case DistanceSource::None:
    default:
        return "none";
    }
}
