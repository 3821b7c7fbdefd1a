/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <optional>
#include <vector>

#include "clinical/ClinicalTypes.hpp"
#include "clinical/Severity.hpp"

enum class NormativeMetric
{
    GaitSpeed,
    Cadence,
    StrideLength,
    CraniovertebralAngle,
    ThoracicKyphosis,
};

struct NormalRange
{
    double low;
    double high;

    bool Contains(const double value) const { return value >= low && value <= high; }
};

/// @brief Normal range of one metric for an age band and sex (NotSet = both)
struct NormativeBand
{
    int ageMin;
    int ageMax;
    BiologicalSex sex;
    NormalRange range;
};

/// @brief Age and sex stratified reference ranges
namespace NormativeData
{
    const std::vector<NormativeBand> &Bands(const NormativeMetric metric);

    /// @brief Normal range for the subject. Without an age the first band is used.
    /// Bands of another sex are skipped and the nearest age band (by midpoint) is used when no band contains the age.
    std::optional<NormalRange> Lookup(const NormativeMetric metric, const std::optional<int> age,
                                      const BiologicalSex sex = BiologicalSex::NotSet);

    /// @brief Deviation relative to the band span: <= 0.25 mild, <= 0.75 moderate, else severe
    Severity Classify(const double value, const NormativeMetric metric, const std::optional<int> age,
                      const BiologicalSex sex = BiologicalSex::NotSet);
}
