/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "histsample/util/common.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace histsample::log
{

//-------------------------------------------------------------------------

// Project-wide logger, writes to stderr until redirected.
[[nodiscard]] spdlog::logger& logger();

void setLevel(spdlog::level::level_enum level);

// Replaces the sinks of the project logger with a single file sink. Throws
// spdlog::spdlog_ex, leaving the current sinks in place, if the file cannot
// be opened.
void redirectToFile(const fs::path& filepath);

//-------------------------------------------------------------------------

}  // namespace histsample::log

//-------------------------------------------------------------------------
