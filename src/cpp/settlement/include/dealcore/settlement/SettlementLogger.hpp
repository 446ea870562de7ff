/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/settlement/SettlementSignals.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace dealcore::settlement
{

// CSV audit trail of every settlement the executor finishes, one line per event.
class SettlementLogger
{
public:
    SettlementLogger(const fs::path& filepath, SettlementSignals& signals);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    static constexpr std::string_view s_header =
        "Date,Time,SettlementId,Kind,Status,TransferId,Note";

private:
    void log(const SettlementEvent& event);

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    bs2::scoped_connection m_settledFeed;
    bs2::scoped_connection m_failedFeed;
};

}  // namespace dealcore::settlement

//-------------------------------------------------------------------------
