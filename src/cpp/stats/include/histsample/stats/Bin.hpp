/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "histsample/util/common.hpp"

//-------------------------------------------------------------------------

namespace histsample::stats
{

//-------------------------------------------------------------------------

/**
 * One row of the source histogram: `count` observations were rounded to
 * `label`, a multiple of the bin width.
 */
struct Bin
{
    Label label{};
    Count count{};

    [[nodiscard]] bool operator==(const Bin& other) const noexcept = default;
};

//-------------------------------------------------------------------------

/**
 * Half-open interval [lo, hi) of raw values represented by a bin's label.
 */
struct BinRange
{
    Value lo{};
    Value hi{};

    [[nodiscard]] Value width() const noexcept { return hi - lo; }
    [[nodiscard]] bool contains(Value value) const noexcept { return lo <= value && value < hi; }

    [[nodiscard]] bool operator==(const BinRange& other) const noexcept = default;
};

//-------------------------------------------------------------------------

/**
 * Raw values represented by `label`. The zero bin only holds [0, w/2)
 * (truncated for odd widths, empty for w == 1); every other bin spans
 * exactly `binWidth` values, [label - w + w/2, label + w/2), so that the
 * ranges tile the integers without gaps. For even widths a range is the
 * preimage of rounding to the nearest multiple of `binWidth`.
 */
[[nodiscard]] constexpr BinRange binRange(Label label, uint64_t binWidth) noexcept
{
    const uint64_t above = binWidth / 2;
    if (label == 0) {
        return BinRange{.lo = 0, .hi = above};
    }
    return BinRange{.lo = label - (binWidth - above), .hi = label + above};
}

//-------------------------------------------------------------------------

}  // namespace histsample::stats

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<histsample::stats::Bin>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const histsample::stats::Bin& bin, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "({}, {})", bin.label, bin.count);
    }
};

template<>
struct fmt::formatter<histsample::stats::BinRange>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const histsample::stats::BinRange& range, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "[{}, {})", range.lo, range.hi);
    }
};

//-------------------------------------------------------------------------
