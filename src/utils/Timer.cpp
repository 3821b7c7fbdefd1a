/*
 * (c) 2021 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "Timer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

Timer::Timer(const std::string &name) : name(name)
{
    Reset();
}

void Timer::Start()
{
    startTime = std::chrono::steady_clock::now();
    running = true;
}

double Timer::End(const bool print)
{
    if (!running) return 0.0;

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startTime;
    running = false;

    const double seconds = elapsed.count();
    accumulated += seconds;
    squareSum += seconds * seconds;
    maximum = std::max(maximum, seconds);
    count++;

    if (print) std::cout << name << ": " << seconds * 1000.0 << " [msec]" << std::endl;
    return seconds;
}

double Timer::Stdev() const
{
    if (count < 2) return -1.0;

    const double mean = accumulated / count;
    const double variance = (squareSum - count * mean * mean) / (count - 1.0);
    return std::sqrt(std::max(0.0, variance));
}

std::string Timer::ResultString() const
{
    using namespace std;

    string ret = "# " + name + " count: " + to_string(count) + ", Accumulated: " + to_string(accumulated) +
                 " [sec], Average: " + to_string(Average() * 1000) + " [msec], Max: " + to_string(maximum * 1000) +
                 " [msec]";
    if (count >= 2) ret += ", Stdev: " + to_string(Stdev() * 1000) + " [msec]";
    return ret;
}

void Timer::Reset()
{
    accumulated = 0.0;
    squareSum = 0.0;
    maximum = 0.0;
    count = 0;
    running = false;
}
