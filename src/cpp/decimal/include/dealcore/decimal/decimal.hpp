/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <source_location>
#include <spanstream>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace dealcore
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace dealcore

//-------------------------------------------------------------------------

namespace dealcore::util
{

inline constexpr uint32_t kDefaultDecimalPlaces = 9;

[[nodiscard]] inline decimal_t round(
    decimal_t val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::trunc(val, decimalPlaces);
}

[[nodiscard]] inline double decimal2double(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalConvertUtil::decimalToDouble(val);
}

[[nodiscard]] inline decimal_t double2decimal(
    double val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return round(decimal_t{val}, decimalPlaces);
}

[[nodiscard]] inline decimal_t min(decimal_t lhs, decimal_t rhs) noexcept
{
    return rhs < lhs ? rhs : lhs;
}

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

[[nodiscard]] inline std::string decimal2str(decimal_t val);

[[nodiscard]] inline decimal_t str2decimal(std::string_view str)
{
    decimal_t out;
    const std::string buf{str};
    if (BloombergLP::bdldfp::DecimalUtil::parseDecimal64(&out, buf.c_str()) != 0) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot parse '{}' as a decimal",
            std::source_location::current().function_name(), str)};
    }
    return out;
}

}  // namespace dealcore::util

//-------------------------------------------------------------------------

namespace dealcore::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace dealcore::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<dealcore::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(dealcore::decimal_t val, FormatContext& ctx) const
    {
        using namespace dealcore::literals;
        char buf[48]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------

namespace dealcore::util
{

inline std::string decimal2str(decimal_t val)
{
    return fmt::format("{}", val);
}

}  // namespace dealcore::util

//-------------------------------------------------------------------------
