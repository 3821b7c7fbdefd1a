/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "StringUtil.hpp"

#include <iomanip>
#include <sstream>

std::string StringUtil::Fixed(const double value, const int precision)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(precision) << value;
    return stream.str();
}

std::vector<std::string> StringUtil::Split(const std::string &text, const char delimiter)
{
    std::vector<std::string> items;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, delimiter))
    {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}
