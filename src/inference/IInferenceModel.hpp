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
#include <vector>

using ModelOutputs = std::map<std::string, std::vector<float>>;

/// @brief A compiled model taking one flat feature vector
class IInferenceModel
{
public:
    virtual ~IInferenceModel(){};

    /// @brief Outputs keyed by tensor name
    /// @exception std::runtime_error when the input does not fit or the execution fails
    virtual ModelOutputs Predict(const std::vector<float> &features) = 0;
};
