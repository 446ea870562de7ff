/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Clock.hpp"

#include <chrono>

//-------------------------------------------------------------------------

namespace dealcore
{

Timestamp SystemClock::now() const
{
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

}  // namespace dealcore

//-------------------------------------------------------------------------
