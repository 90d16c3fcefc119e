/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "histsample/stats/EmpiricalHistogram.hpp"
#include "histsample/stats/HistogramSampler.hpp"

#include <span>

//-------------------------------------------------------------------------

namespace histsample::stats
{

//-------------------------------------------------------------------------

struct ComparisonRow
{
    Label label;
    double expected;
    double observed;

    [[nodiscard]] double diff() const noexcept { return observed - expected; }
};

//-------------------------------------------------------------------------

// One row per label present in either histogram, ascending.
[[nodiscard]] std::vector<ComparisonRow> compare(
    const HistogramSampler& sampler, const EmpiricalHistogram& observed);

[[nodiscard]] std::string formatComparison(std::span<const ComparisonRow> rows);

//-------------------------------------------------------------------------

}  // namespace histsample::stats

//-------------------------------------------------------------------------
