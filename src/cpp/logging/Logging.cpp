/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "dealcore/logging/Logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

//-------------------------------------------------------------------------

namespace dealcore::logging
{

//-------------------------------------------------------------------------

namespace
{

std::mutex s_mutex;

constexpr std::string_view s_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

}  // namespace

//-------------------------------------------------------------------------

LoggingConfig makeLoggingConfig(pugi::xml_node node)
{
    LoggingConfig config;
    if (pugi::xml_attribute attr = node.attribute("level"); !attr.empty()) {
        config.level = spdlog::level::from_str(attr.as_string());
        if (config.level == spdlog::level::off && std::string_view{attr.as_string()} != "off") {
            throw std::invalid_argument{fmt::format(
                "{}: Unknown log level '{}'",
                std::source_location::current().function_name(), attr.as_string())};
        }
    }
    if (pugi::xml_attribute attr = node.attribute("file"); !attr.empty()) {
        config.file = fs::path{attr.as_string()};
    }
    if (pugi::xml_attribute attr = node.attribute("settlementLog"); !attr.empty()) {
        config.settlementLog = fs::path{attr.as_string()};
    }
    return config;
}

//-------------------------------------------------------------------------

void configure(const LoggingConfig& config)
{
    std::lock_guard lock{s_mutex};

    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    if (config.file.has_value()) {
        if (config.file->has_parent_path()) {
            fs::create_directories(config.file->parent_path());
        }
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file->string()));
    }

    auto logger = std::make_shared<spdlog::logger>(
        std::string{kLoggerName}, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern(std::string{s_pattern});
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(std::string{kLoggerName});
    spdlog::register_logger(logger);
}

//-------------------------------------------------------------------------

std::shared_ptr<spdlog::logger> get()
{
    if (auto logger = spdlog::get(std::string{kLoggerName})) [[likely]] {
        return logger;
    }
    std::lock_guard lock{s_mutex};
    if (auto logger = spdlog::get(std::string{kLoggerName})) {
        return logger;
    }
    auto logger = spdlog::stdout_color_mt(std::string{kLoggerName});
    logger->set_pattern(std::string{s_pattern});
    return logger;
}

//-------------------------------------------------------------------------

}  // namespace dealcore::logging

//-------------------------------------------------------------------------
