/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <string>
#include <vector>

namespace StringUtil
{
    /// @brief Fixed point representation, e.g. Fixed(3.14159, 1) == "3.1"
    std::string Fixed(const double value, const int precision);

    /// @brief Split on the delimiter, dropping empty items
    std::vector<std::string> Split(const std::string &text, const char delimiter);
}
