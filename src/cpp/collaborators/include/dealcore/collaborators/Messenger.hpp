/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace dealcore::collaborators
{

class Messenger
{
public:
    virtual ~Messenger() noexcept = default;

    [[nodiscard]] virtual bool deliverProposalCard(
        const std::string& channel, const RecordId& recordId) = 0;

    virtual void notify(const std::string& channel, const std::string& text) = 0;
};

}  // namespace dealcore::collaborators

//-------------------------------------------------------------------------
