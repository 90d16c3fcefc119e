/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "histsample/util/util.hpp"

#include <boost/algorithm/string.hpp>

#include <charconv>

//-------------------------------------------------------------------------

namespace histsample::util
{

//-------------------------------------------------------------------------

std::vector<std::string> tokenize(std::string_view str)
{
    std::vector<std::string> res;
    const std::string trimmed = boost::trim_copy(std::string{str});
    if (trimmed.empty()) {
        return res;
    }
    boost::split(res, trimmed, boost::is_any_of(" \t"), boost::token_compress_on);
    return res;
}

//-------------------------------------------------------------------------

std::optional<uint64_t> parseUnsigned(std::string_view str) noexcept
{
    uint64_t value{};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

//-------------------------------------------------------------------------

}  // namespace histsample::util

//-------------------------------------------------------------------------
