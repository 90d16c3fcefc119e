/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------

namespace histsample::stats
{

//-------------------------------------------------------------------------

/**
 * Supplier of uniformly distributed integers. Implementations own whatever
 * generator state they need; callers never share one instance across
 * threads without synchronizing it themselves.
 */
struct RandomSource
{
    virtual ~RandomSource() noexcept = default;

    // Uniform draw from [0, bound). Requires bound > 0.
    [[nodiscard]] virtual uint64_t uniformBelow(uint64_t bound) = 0;
};

//-------------------------------------------------------------------------

}  // namespace histsample::stats

//-------------------------------------------------------------------------
