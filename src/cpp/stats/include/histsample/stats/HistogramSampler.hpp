/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "histsample/process/UrbgRandomSource.hpp"
#include "histsample/stats/Bin.hpp"
#include "histsample/stats/RandomSource.hpp"
#include "histsample/util/common.hpp"

#include <pugixml.hpp>

#include <random>

//-------------------------------------------------------------------------

namespace histsample::stats
{

//-------------------------------------------------------------------------

struct HistogramSamplerDesc
{
    std::vector<Bin> bins;
    uint64_t binWidth{};
};

//-------------------------------------------------------------------------

/**
 * Samples values from the distribution summarized by a histogram whose
 * original values were rounded to the nearest multiple of the bin width.
 *
 * Each draw first picks a bin with probability proportional to its count,
 * then a value uniformly within the bin's range (see binRange()). The
 * sampler holds no generator state and never changes after construction,
 * so one instance may be read from any number of threads.
 *
 * Input requirements, checked on construction (InvalidInput otherwise):
 *  - binWidth > 0, at least one bin, and a positive total count that fits
 *    into 64 bits;
 *  - labels are unique multiples of binWidth. Missing labels between
 *    present ones are treated as empty bins;
 *  - no positive count on a bin with an empty range (label 0 with
 *    binWidth 1).
 *
 * With small bin widths the source histogram tends to under-count the zero
 * bin and over-count the next one, because values near w/2 spill upward
 * when the data is produced. Weights are reproduced as given.
 */
class HistogramSampler
{
public:
    explicit HistogramSampler(HistogramSamplerDesc desc);

    [[nodiscard]] uint64_t sample(RandomSource& source) const;

    template<std::uniform_random_bit_generator URBG>
    [[nodiscard]] uint64_t sample(URBG& rng) const
    {
        process::UrbgRandomSource<URBG> source{rng};
        return sample(source);
    }

    [[nodiscard]] const std::vector<Bin>& bins() const noexcept { return m_bins; }
    [[nodiscard]] uint64_t binWidth() const noexcept { return m_binWidth; }
    [[nodiscard]] uint64_t totalWeight() const noexcept { return m_totalWeight; }

    [[nodiscard]] BinRange rangeOf(const Bin& bin) const noexcept
    {
        return binRange(bin.label, m_binWidth);
    }

    // Every sampled value is strictly below this.
    [[nodiscard]] Value upperBound() const noexcept;

    [[nodiscard]] double probability(Label label) const noexcept;

    [[nodiscard]] static HistogramSampler fromBins(std::vector<Bin> bins, uint64_t binWidth);
    [[nodiscard]] static HistogramSampler fromXML(
        pugi::xml_node node, const fs::path& baseDir = {});

private:
    std::vector<Bin> m_bins;
    std::vector<uint64_t> m_cumulative;
    uint64_t m_binWidth;
    uint64_t m_totalWeight{};
};

//-------------------------------------------------------------------------

}  // namespace histsample::stats

//-------------------------------------------------------------------------
