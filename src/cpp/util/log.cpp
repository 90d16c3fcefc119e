/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "histsample/util/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

//-------------------------------------------------------------------------

namespace histsample::log
{

//-------------------------------------------------------------------------

namespace
{

std::unique_ptr<spdlog::logger> makeLogger()
{
    auto logger = std::make_unique<spdlog::logger>(
        "histsample", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    logger->set_level(spdlog::level::info);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    return logger;
}

}  // namespace

//-------------------------------------------------------------------------

spdlog::logger& logger()
{
    static std::unique_ptr<spdlog::logger> s_logger = makeLogger();
    return *s_logger;
}

//-------------------------------------------------------------------------

void setLevel(spdlog::level::level_enum level)
{
    logger().set_level(level);
    logger().flush_on(level);
}

//-------------------------------------------------------------------------

void redirectToFile(const fs::path& filepath)
{
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filepath.string());
    auto& sinks = logger().sinks();
    sinks.clear();
    sinks.push_back(std::move(sink));
}

//-------------------------------------------------------------------------

}  // namespace histsample::log

//-------------------------------------------------------------------------
