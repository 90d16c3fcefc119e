/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "histsample/process/RNG.hpp"

//-------------------------------------------------------------------------

namespace histsample::process
{

//-------------------------------------------------------------------------

RNG::RNG(uint64_t seed) noexcept
    : std::mt19937_64{seed}, m_seed{seed}
{}

//-------------------------------------------------------------------------

std::mt19937_64::result_type RNG::operator()()
{
    ++m_callCount;
    return std::mt19937_64::operator()();
}

//-------------------------------------------------------------------------

RNG RNG::fromState(uint64_t seed, uint64_t callCount)
{
    RNG rng{seed};
    rng.m_callCount = callCount;
    rng.discard(rng.m_callCount);
    return rng;
}

//-------------------------------------------------------------------------

}  // namespace histsample::process

//-------------------------------------------------------------------------
