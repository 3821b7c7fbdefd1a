/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "Severity.hpp"

#include <algorithm>

Severity SeverityUtil::FromOrdinal(const int ordinal)
{
    if (ordinal <= 0) return Severity::Normal;
    if (ordinal == 1) return Severity::Mild;
    if (ordinal == 2) return Severity::Moderate;
    return Severity::Severe;
}

Severity SeverityUtil::Worse(const Severity a, const Severity b)
{
    return FromOrdinal(std::max(Ordinal(a), Ordinal(b)));
}

std::string SeverityUtil::ToString(const Severity severity)
{
    switch (severity)
    {
    case Severity::Normal:
        return "normal";
    case Severity::Mild:
        return "mild";
    case Severity::Moderate:
        return "moderate";
    case Severity::Severe:
        return "severe";
    }
    return "normal";
}

std::string SeverityUtil::ColorName(const Severity severity)
{
    switch (severity)
    {
    case Severity::Normal:
        return "green";
    case Severity::Mild:
        return "yellow";
    case Severity::Moderate:
        return "orange";
    case Severity::Severe:
        return "red";
    }
    return "green";
}

SegmentSeverityMap SeverityUtil::PropagateToSegments(const std::map<JointName, Severity> &jointSeverities)
{
    const auto severityOf = [&jointSeverities](const JointName joint) {
        const auto it = jointSeverities.find(joint);
        return it == jointSeverities.end() ? Severity::Normal : it->second;
    };

    SegmentSeverityMap segments;
    for (const auto &segment : JointNameUtil::SkeletonSegments())
    {
        segments[segment] = Worse(severityOf(segment.first), severityOf(segment.second));
    }
    return segments;
}
