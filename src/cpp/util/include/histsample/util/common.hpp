/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace views = ranges::views;

//-------------------------------------------------------------------------

using Label = uint64_t;
using Count = uint64_t;
using Value = uint64_t;

//-------------------------------------------------------------------------
