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

/// @brief Model input. Absent values are written as the sentinel used when the models were trained.
class FeatureVector
{
private:
    std::vector<float> values;

    explicit FeatureVector(const std::vector<float> &values) : values(values){};

public:
    static constexpr double SENTINEL = -1.0;

    /// @retval std::nullopt when the length differs from expectedLength or a present value is not finite
    static std::optional<FeatureVector> Create(const std::vector<std::optional<double>> &features,
                                               const size_t expectedLength);

    const std::vector<float> &Values() const { return values; }
    size_t Size() const { return values.size(); }
};
