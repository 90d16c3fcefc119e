/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "histsample/stats/RandomSource.hpp"

#include <boost/random/uniform_int_distribution.hpp>

#include <random>

//-------------------------------------------------------------------------

namespace histsample::process
{

//-------------------------------------------------------------------------

/**
 * RandomSource over a borrowed standard generator. Bounded draws go through
 * boost::random so that a given seed yields the same values with every
 * standard library.
 */
template<std::uniform_random_bit_generator URBG>
class UrbgRandomSource : public stats::RandomSource
{
public:
    explicit UrbgRandomSource(URBG& rng) noexcept : m_rng{rng} {}

    virtual uint64_t uniformBelow(uint64_t bound) override
    {
        return boost::random::uniform_int_distribution<uint64_t>{0, bound - 1}(m_rng);
    }

private:
    URBG& m_rng;
};

//-------------------------------------------------------------------------

}  // namespace histsample::process

//-------------------------------------------------------------------------
