/*
 * (c) 2021 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#pragma once

#include <chrono>
#include <string>

/// @brief Latency timer. Measures the code between Start() and End() on the monotonic clock.
/// Keeps the count, total, mean, sample standard deviation and the worst case.
class Timer
{
private:
    std::string name;

    std::chrono::steady_clock::time_point startTime;
    double accumulated;
    double squareSum;
    double maximum;
    unsigned int count;
    bool running;

public:
    Timer(const std::string &name = "Timer");

    void Start();

    /// @brief Ends the current measurement and returns its duration in seconds (0 when not started)
    double End(const bool print = false);

    unsigned int Count() const { return count; }
    double Accumulated() const { return accumulated; }
    double Average() const { return count == 0 ? 0.0 : accumulated / count; }
    double Max() const { return maximum; }

    /// @brief Sample standard deviation (Bessel corrected), -1.0 below two samples
    double Stdev() const;

    std::string ResultString() const;

    void Reset();
};
