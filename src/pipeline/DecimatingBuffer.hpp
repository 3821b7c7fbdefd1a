/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <utility>
#include <vector>

/// @brief Bounded buffer that halves the density of its oldest half when it reaches capacity.
///
/// After a decimation the buffer holds capacity / 4 (every second element of the oldest half)
/// plus capacity / 2 (the newest half) elements. The first and the last element always survive,
/// so the time span of the recording is preserved.
template <class T>
class DecimatingBuffer
{
private:
    size_t capacity;
    std::vector<T> items;

    void decimate()
    {
        const size_t half = items.size() / 2;
        std::vector<T> kept;
        kept.reserve(capacity);
        for (size_t i = 0; i < half; i += 2) kept.push_back(std::move(items[i]));
        for (size_t i = half; i < items.size(); i++) kept.push_back(std::move(items[i]));
        items.swap(kept);
    }

public:
    explicit DecimatingBuffer(const size_t capacity) : capacity(capacity) { items.reserve(capacity); }
    ~DecimatingBuffer(){};

    /// @retval true when the append triggered a decimation
    bool Append(const T &item)
    {
        items.push_back(item);
        if (items.size() < capacity) return false;
        decimate();
        return true;
    }

    void Clear() { items.clear(); }

    size_t Size() const { return items.size(); }
    size_t Capacity() const { return capacity; }
    bool Empty() const { return items.empty(); }

    const std::vector<T> &Items() const { return items; }
    const T &Back() const { return items.back(); }
};
