/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/chrono.h>

#include <ctime>

//-------------------------------------------------------------------------

namespace dealcore::util
{

//-------------------------------------------------------------------------

std::string generateId(std::string_view prefix)
{
    static constexpr size_t idChars = 12;
    thread_local boost::uuids::random_generator gen;
    auto hex = boost::uuids::to_string(gen());
    boost::algorithm::erase_all(hex, "-");
    return fmt::format("{}_{}", prefix, hex.substr(0, idChars));
}

//-------------------------------------------------------------------------

std::string normalizeTag(std::string_view tag)
{
    std::string normalized = boost::algorithm::to_lower_copy(
        boost::algorithm::trim_copy(std::string{tag}));
    if (normalized.starts_with('@')) {
        normalized.erase(0, 1);
    }
    return normalized;
}

//-------------------------------------------------------------------------

bool tagsMatch(std::string_view lhs, std::string_view rhs)
{
    const auto normalizedLhs = normalizeTag(lhs);
    return !normalizedLhs.empty() && normalizedLhs == normalizeTag(rhs);
}

//-------------------------------------------------------------------------

std::string formatAmount(decimal_t amount, uint32_t decimals)
{
    return fmt::format("{:.{}f}", decimal2double(amount), decimals);
}

//-------------------------------------------------------------------------

std::string formatTimestamp(Timestamp timestamp)
{
    return fmt::format(
        "{:%Y-%m-%d %H:%M:%S}", fmt::gmtime(static_cast<std::time_t>(timestamp)));
}

//-------------------------------------------------------------------------

}  // namespace dealcore::util

//-------------------------------------------------------------------------
