/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <random>

//-------------------------------------------------------------------------

namespace histsample::process
{

//-------------------------------------------------------------------------

class RNG : public std::mt19937_64
{
public:
    explicit RNG(uint64_t seed = std::mt19937_64::default_seed) noexcept;

    std::mt19937_64::result_type operator()();

    [[nodiscard]] uint64_t initialSeed() const noexcept { return m_seed; }
    [[nodiscard]] uint64_t callCount() const noexcept { return m_callCount; }

    [[nodiscard]] static RNG fromState(uint64_t seed, uint64_t callCount);

private:
    uint64_t m_callCount{};
    uint64_t m_seed;
};

//-------------------------------------------------------------------------

}  // namespace histsample::process

//-------------------------------------------------------------------------
