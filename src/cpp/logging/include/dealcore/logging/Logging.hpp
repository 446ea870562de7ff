/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace dealcore::logging
{

//-------------------------------------------------------------------------

inline constexpr std::string_view kLoggerName = "dealcore";

struct LoggingConfig
{
    spdlog::level::level_enum level{spdlog::level::info};
    std::optional<fs::path> file;
    std::optional<fs::path> settlementLog;
};

[[nodiscard]] LoggingConfig makeLoggingConfig(pugi::xml_node node);

// Replaces any previously configured core logger.
void configure(const LoggingConfig& config);

// The core logger; created with a stdout sink on first use if `configure` was never called.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

//-------------------------------------------------------------------------

}  // namespace dealcore::logging

//-------------------------------------------------------------------------
