/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "histsample/stats/EmpiricalHistogram.hpp"

#include "histsample/util/InvalidInput.hpp"

//-------------------------------------------------------------------------

namespace histsample::stats
{

//-------------------------------------------------------------------------

EmpiricalHistogram::EmpiricalHistogram(uint64_t binWidth)
    : m_binWidth{binWidth}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (binWidth == 0) {
        throw InvalidInput{fmt::format("{}: binWidth should be > 0, was {}", ctx, binWidth)};
    }
}

//-------------------------------------------------------------------------

void EmpiricalHistogram::record(Value value)
{
    ++m_counts[roundToBin(value, m_binWidth)];
    ++m_total;
}

//-------------------------------------------------------------------------

Count EmpiricalHistogram::count(Label label) const noexcept
{
    const auto it = m_counts.find(label);
    return it != m_counts.end() ? it->second : 0;
}

//-------------------------------------------------------------------------

double EmpiricalHistogram::proportion(Label label) const noexcept
{
    if (m_total == 0) {
        return 0.0;
    }
    return static_cast<double>(count(label)) / static_cast<double>(m_total);
}

//-------------------------------------------------------------------------

Label EmpiricalHistogram::roundToBin(Value value, uint64_t binWidth) noexcept
{
    // Same as binWidth * ((value + binWidth / 2) / binWidth) without the
    // intermediate overflow.
    const Value down = value - value % binWidth;
    return value % binWidth >= binWidth - binWidth / 2 ? down + binWidth : down;
}

//-------------------------------------------------------------------------

}  // namespace histsample::stats

//-------------------------------------------------------------------------
