/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore::collaborators
{

class OutcomeSource
{
public:
    virtual ~OutcomeSource() noexcept = default;

    [[nodiscard]] virtual std::optional<uint32_t> draw(
        std::string_view game, const std::string& channel) = 0;
};

}  // namespace dealcore::collaborators

//-------------------------------------------------------------------------
