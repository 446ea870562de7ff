/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"

//-------------------------------------------------------------------------

namespace dealcore
{

class Clock
{
public:
    virtual ~Clock() noexcept = default;

    [[nodiscard]] virtual Timestamp now() const = 0;

protected:
    Clock() noexcept = default;
};

//-------------------------------------------------------------------------

class SystemClock : public Clock
{
public:
    [[nodiscard]] Timestamp now() const override;
};

}  // namespace dealcore

//-------------------------------------------------------------------------
