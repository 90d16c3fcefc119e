/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "histsample/util/common.hpp"

#include <map>

//-------------------------------------------------------------------------

namespace histsample::stats
{

//-------------------------------------------------------------------------

/**
 * Histogram of observed values, rounded to the nearest multiple of the bin
 * width the same way the source histograms were produced.
 */
class EmpiricalHistogram
{
public:
    explicit EmpiricalHistogram(uint64_t binWidth);

    void record(Value value);

    [[nodiscard]] uint64_t binWidth() const noexcept { return m_binWidth; }
    [[nodiscard]] uint64_t total() const noexcept { return m_total; }
    [[nodiscard]] const std::map<Label, Count>& counts() const noexcept { return m_counts; }
    [[nodiscard]] Count count(Label label) const noexcept;
    [[nodiscard]] double proportion(Label label) const noexcept;

    [[nodiscard]] static Label roundToBin(Value value, uint64_t binWidth) noexcept;

private:
    uint64_t m_binWidth;
    uint64_t m_total{};
    std::map<Label, Count> m_counts;
};

//-------------------------------------------------------------------------

}  // namespace histsample::stats

//-------------------------------------------------------------------------
