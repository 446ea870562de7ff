/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ErrorCode.hpp"
#include "dealcore/decimal/decimal.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace dealcore
{

inline void PrintTo(const decimal_t& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

inline void PrintTo(const Error& error, std::ostream* os)
{
    *os << fmt::format("{}", error);
}

inline void PrintTo(ErrorCode ec, std::ostream* os)
{
    *os << ErrorCode2StrView(ec);
}

}  // namespace dealcore

//-------------------------------------------------------------------------
