/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <map>
#include <string>
#include <utility>

#include "Types.hpp"

/// @brief Ordered clinical severity. Always derived from a threshold, never stored on its own.
enum class Severity
{
    Normal = 0,
    Mild = 1,
    Moderate = 2,
    Severe = 3,
};

using SegmentSeverityMap = std::map<std::pair<JointName, JointName>, Severity>;

namespace SeverityUtil
{
    inline int Ordinal(const Severity severity) { return static_cast<int>(severity); }

    /// @brief Negative ordinals map to normal, ordinals above 3 map to severe
    Severity FromOrdinal(const int ordinal);

    Severity Worse(const Severity a, const Severity b);

    std::string ToString(const Severity severity);

    /// @brief Display color used by the overlay and the reports
    std::string ColorName(const Severity severity);

    /// @brief Severity of each skeleton segment = worse of its two endpoints. Joints without a severity count as normal.
    SegmentSeverityMap PropagateToSegments(const std::map<JointName, Severity> &jointSeverities);
}
