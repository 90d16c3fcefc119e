/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "histsample/util/common.hpp"

//-------------------------------------------------------------------------

namespace histsample::util
{

//-------------------------------------------------------------------------

/**
 * Splits on any run of spaces or tabs, dropping empty tokens.
 */
[[nodiscard]] std::vector<std::string> tokenize(std::string_view str);

[[nodiscard]] std::optional<uint64_t> parseUnsigned(std::string_view str) noexcept;

//-------------------------------------------------------------------------

}  // namespace histsample::util

//-------------------------------------------------------------------------
