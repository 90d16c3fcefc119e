/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "histsample/stats/HistogramComparison.hpp"

#include <set>

//-------------------------------------------------------------------------

namespace histsample::stats
{

//-------------------------------------------------------------------------

std::vector<ComparisonRow> compare(
    const HistogramSampler& sampler, const EmpiricalHistogram& observed)
{
    const auto labels = views::concat(
        sampler.bins() | views::transform(&Bin::label),
        observed.counts() | views::keys)
        | ranges::to<std::set>();

    return labels
        | views::transform([&](Label label) {
            return ComparisonRow{
                .label = label,
                .expected = sampler.probability(label),
                .observed = observed.proportion(label)
            };
        })
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

std::string formatComparison(std::span<const ComparisonRow> rows)
{
    std::string out = fmt::format("{:>8}\t{:>7}\t{:>7}\t{:>7}\n", "label", "exp%", "obs%", "diff");
    for (const ComparisonRow& row : rows) {
        fmt::format_to(
            std::back_inserter(out),
            "{:>8}\t{:>6.1f}%\t{:>6.1f}%\t{:>7.2f}\n",
            row.label,
            100.0 * row.expected,
            100.0 * row.observed,
            100.0 * row.diff());
    }
    return out;
}

//-------------------------------------------------------------------------

}  // namespace histsample::stats

//-------------------------------------------------------------------------
