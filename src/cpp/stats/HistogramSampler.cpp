/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "histsample/stats/HistogramSampler.hpp"

#include "histsample/io/HistogramReader.hpp"
#include "histsample/util/InvalidInput.hpp"
#include "histsample/util/log.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace histsample::stats
{

//-------------------------------------------------------------------------

HistogramSampler::HistogramSampler(HistogramSamplerDesc desc)
    : m_bins{std::move(desc.bins)},
      m_binWidth{desc.binWidth}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_binWidth == 0) {
        throw InvalidInput{fmt::format("{}: binWidth should be > 0, was {}", ctx, m_binWidth)};
    }
    if (m_bins.empty()) {
        throw InvalidInput{fmt::format("{}: at least one bin is required", ctx)};
    }

    std::ranges::sort(m_bins, {}, &Bin::label);

    if (auto dup = std::ranges::adjacent_find(m_bins, {}, &Bin::label); dup != m_bins.end()) {
        throw InvalidInput{fmt::format("{}: duplicate label {}", ctx, dup->label)};
    }

    const uint64_t maxLabel = std::numeric_limits<uint64_t>::max() - m_binWidth;
    m_cumulative.reserve(m_bins.size());
    for (const Bin& bin : m_bins) {
        if (bin.label % m_binWidth != 0) {
            throw InvalidInput{fmt::format(
                "{}: label {} is not a multiple of binWidth {}", ctx, bin.label, m_binWidth)};
        }
        if (bin.label > maxLabel) {
            throw InvalidInput{fmt::format(
                "{}: range of label {} exceeds the value domain", ctx, bin.label)};
        }
        if (bin.count > 0 && rangeOf(bin).width() == 0) {
            throw InvalidInput{fmt::format(
                "{}: bin {} has no values with binWidth {}", ctx, bin, m_binWidth)};
        }
        if (bin.count > std::numeric_limits<uint64_t>::max() - m_totalWeight) {
            throw InvalidInput{fmt::format(
                "{}: total count overflows at bin {}", ctx, bin)};
        }
        m_totalWeight += bin.count;
        m_cumulative.push_back(m_totalWeight);
    }

    if (m_totalWeight == 0) {
        throw InvalidInput{fmt::format(
            "{}: total count should be > 0, all {} bins are empty", ctx, m_bins.size())};
    }

    log::logger().debug(
        "HistogramSampler: {} bins, binWidth {}, totalWeight {}, values in [0, {})",
        m_bins.size(), m_binWidth, m_totalWeight, upperBound());
}

//-------------------------------------------------------------------------

uint64_t HistogramSampler::sample(RandomSource& source) const
{
    // First bin whose inclusive running count exceeds the draw; empty bins
    // repeat the previous running count and are skipped.
    const uint64_t r = source.uniformBelow(m_totalWeight);
    const auto it = std::ranges::upper_bound(m_cumulative, r);
    const Bin& bin = m_bins[static_cast<size_t>(it - m_cumulative.begin())];

    const BinRange range = rangeOf(bin);
    return range.lo + source.uniformBelow(range.width());
}

//-------------------------------------------------------------------------

Value HistogramSampler::upperBound() const noexcept
{
    const auto last = std::find_if(
        m_bins.rbegin(), m_bins.rend(), [](const Bin& bin) { return bin.count > 0; });
    return last == m_bins.rend() ? 0 : rangeOf(*last).hi;
}

//-------------------------------------------------------------------------

double HistogramSampler::probability(Label label) const noexcept
{
    const auto it = std::ranges::lower_bound(m_bins, label, {}, &Bin::label);
    if (it == m_bins.end() || it->label != label) {
        return 0.0;
    }
    return static_cast<double>(it->count) / static_cast<double>(m_totalWeight);
}

//-------------------------------------------------------------------------

HistogramSampler HistogramSampler::fromBins(std::vector<Bin> bins, uint64_t binWidth)
{
    return HistogramSampler{HistogramSamplerDesc{
        .bins = std::move(bins),
        .binWidth = binWidth
    }};
}

//-------------------------------------------------------------------------

HistogramSampler HistogramSampler::fromXML(pugi::xml_node node, const fs::path& baseDir)
{
    return HistogramSampler{io::HistogramReader::fromXML(node, baseDir)};
}

//-------------------------------------------------------------------------

}  // namespace histsample::stats

//-------------------------------------------------------------------------
