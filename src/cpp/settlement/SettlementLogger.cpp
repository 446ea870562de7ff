/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/settlement/SettlementLogger.hpp"

#include "util.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace dealcore::settlement
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string csvField(std::string_view field)
{
    if (field.find_first_of(",\"\n") == std::string_view::npos) {
        return std::string{field};
    }
    return fmt::format("\"{}\"", boost::algorithm::replace_all_copy(std::string{field}, "\"", "\"\""));
}

}  // namespace

//-------------------------------------------------------------------------

SettlementLogger::SettlementLogger(const fs::path& filepath, SettlementSignals& signals)
    : m_filepath{filepath}
{
    if (m_filepath.has_parent_path()) {
        fs::create_directories(m_filepath.parent_path());
    }
    m_logger = std::make_unique<spdlog::logger>(
        "SettlementLogger",
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(m_filepath.string()));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
    m_logger->trace(s_header);
    m_logger->flush();

    m_settledFeed = signals.settled.connect([this](const SettlementEvent& event) { log(event); });
    m_failedFeed = signals.failed.connect([this](const SettlementEvent& event) { log(event); });
}

//-------------------------------------------------------------------------

void SettlementLogger::log(const SettlementEvent& event)
{
    const auto dateTime = util::formatTimestamp(event.timestamp);
    const auto split = dateTime.find(' ');
    m_logger->trace(fmt::format(
        "{},{},{},{},{},{},{}",
        dateTime.substr(0, split),
        dateTime.substr(split + 1),
        csvField(event.settlementId),
        csvField(event.kind),
        event.status,
        csvField(event.transferId.value_or("")),
        csvField(event.note.value_or(""))));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace dealcore::settlement

//-------------------------------------------------------------------------
