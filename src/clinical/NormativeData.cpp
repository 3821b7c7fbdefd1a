/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "NormativeData.hpp"

#include <cstdlib>

namespace
{
    using S = BiologicalSex;

    // Bohannon & Williams Andrews, 2011
    const std::vector<NormativeBand> GAIT_SPEED_BANDS = {
        {20, 29, S::Male, {1.10, 1.36}},   {20, 29, S::Female, {1.10, 1.34}}, {30, 39, S::Male, {1.10, 1.43}},
        {30, 39, S::Female, {1.10, 1.34}}, {40, 49, S::Male, {1.10, 1.43}},   {40, 49, S::Female, {1.10, 1.39}},
        {50, 59, S::Male, {1.00, 1.31}},   {50, 59, S::Female, {1.00, 1.27}}, {60, 69, S::Male, {1.00, 1.24}},
        {60, 69, S::Female, {1.00, 1.24}}, {70, 79, S::Male, {0.90, 1.13}},   {70, 79, S::Female, {0.90, 1.13}},
        {80, 99, S::Male, {0.70, 0.94}},   {80, 99, S::Female, {0.70, 0.94}},
    };

    // Hollman et al., 2011
    const std::vector<NormativeBand> CADENCE_BANDS = {
        {20, 39, S::Male, {112.0, 120.0}}, {20, 39, S::Female, {115.0, 125.0}}, {40, 59, S::Male, {105.0, 115.0}},
        {40, 59, S::Female, {110.0, 120.0}}, {60, 79, S::Male, {98.0, 110.0}},  {60, 79, S::Female, {100.0, 115.0}},
    };

    // Oberg et al., 1993
    const std::vector<NormativeBand> STRIDE_LENGTH_BANDS = {
        {20, 29, S::Male, {1.25, 1.46}}, {20, 29, S::Female, {1.10, 1.28}}, {40, 49, S::Male, {1.20, 1.44}},
        {40, 49, S::Female, {1.05, 1.26}}, {60, 69, S::Male, {1.10, 1.32}}, {60, 69, S::Female, {0.95, 1.18}},
        {70, 79, S::Male, {1.00, 1.22}}, {70, 79, S::Female, {0.85, 1.08}},
    };

    const std::vector<NormativeBand> CVA_BANDS = {
        {20, 39, S::NotSet, {48.0, 56.0}},
        {40, 59, S::NotSet, {44.0, 54.0}},
        {60, 99, S::NotSet, {40.0, 50.0}},
    };

    // Fon et al., 1980
    const std::vector<NormativeBand> KYPHOSIS_BANDS = {
        {20, 29, S::NotSet, {20.0, 30.0}},
        {30, 49, S::NotSet, {25.0, 40.0}},
        {50, 69, S::NotSet, {30.0, 50.0}},
        {70, 99, S::NotSet, {35.0, 55.0}},
    };

    int midpoint(const NormativeBand &band) { return (band.ageMin + band.ageMax) / 2; }
}

const std::vector<NormativeBand> &NormativeData::Bands(const NormativeMetric metric)
{
    switch (metric)
    {
    case NormativeMetric::GaitSpeed:
        return GAIT_SPEED_BANDS;
    case NormativeMetric::Cadence:
        return CADENCE_BANDS;
    case NormativeMetric::StrideLength:
        return STRIDE_LENGTH_BANDS;
    case NormativeMetric::CraniovertebralAngle:
        return CVA_BANDS;
    case NormativeMetric::ThoracicKyphosis:
        return KYPHOSIS_BANDS;
    }
    return CVA_BANDS;
}

std::optional<NormalRange> NormativeData::Lookup(const NormativeMetric metric, const std::optional<int> age,
                                                 const BiologicalSex sex)
{
    const std::vector<NormativeBand> &table = Bands(metric);
    if (table.empty()) return std::nullopt;
    if (!age) return table.front().range;

    std::vector<NormativeBand> pool;
    for (const NormativeBand &band : table)
    {
        if (band.sex == sex || band.sex == BiologicalSex::NotSet) pool.push_back(band);
    }
    if (pool.empty()) pool = table;

    for (const NormativeBand &band : pool)
    {
        if (*age >= band.ageMin && *age <= band.ageMax) return band.range;
    }

    // nearest age band, first one wins on equal distance
    const NormativeBand *nearest = &pool.front();
    for (const NormativeBand &band : pool)
    {
        if (std::abs(midpoint(band) - *age) < std::abs(midpoint(*nearest) - *age)) nearest = &band;
    }
    return nearest->range;
}

Severity NormativeData::Classify(const double value, const NormativeMetric metric, const std::optional<int> age,
                                 const BiologicalSex sex)
{
    const std::optional<NormalRange> range = Lookup(metric, age, sex);
    if (!range || range->Contains(value)) return Severity::Normal;

    const double deviation = value < range->low ? range->low - value : value - range->high;
    const double span = range->high - range->low;
    const double relativeDeviation = span > 0.0 ? deviation / span : deviation;

    if (relativeDeviation <= 0.25) return Severity::Mild;
    if (relativeDeviation <= 0.75) return Severity::Moderate;
    return Severity::Severe;
}
