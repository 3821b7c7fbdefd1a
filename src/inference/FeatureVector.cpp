/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "FeatureVector.hpp"

#include <cmath>

std::optional<FeatureVector> FeatureVector::Create(const std::vector<std::optional<double>> &features,
                                                   const size_t expectedLength)
{
    if (features.size() != expectedLength) return std::nullopt;

    std::vector<float> values;
    values.reserve(features.size());
    for (const std::optional<double> &feature : features)
    {
        if (!feature)
        {
            values.push_back(static_cast<float>(SENTINEL));
            continue;
        }
        if (!std::isfinite(*feature)) return std::nullopt;
        values.push_back(static_cast<float>(*feature));
    }
    return FeatureVector(values);
}
