/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace dealcore::util
{

//-------------------------------------------------------------------------

// Random identifier of the form "<prefix>_<12 hex chars>".
[[nodiscard]] std::string generateId(std::string_view prefix);

// Trimmed, lowercased and stripped of one leading '@'.
[[nodiscard]] std::string normalizeTag(std::string_view tag);

[[nodiscard]] bool tagsMatch(std::string_view lhs, std::string_view rhs);

[[nodiscard]] std::string formatAmount(decimal_t amount, uint32_t decimals = 2);

[[nodiscard]] std::string formatTimestamp(Timestamp timestamp);

//-------------------------------------------------------------------------

}  // namespace dealcore::util

//-------------------------------------------------------------------------
