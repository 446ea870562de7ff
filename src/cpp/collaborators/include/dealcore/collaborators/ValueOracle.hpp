/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore::collaborators
{

class ValueOracle
{
public:
    virtual ~ValueOracle() noexcept = default;

    [[nodiscard]] virtual std::optional<decimal_t> estimateValue(const ItemRef& itemRef) = 0;
};

}  // namespace dealcore::collaborators

//-------------------------------------------------------------------------
