/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace histsample
{

//-------------------------------------------------------------------------

class InvalidInput : public std::invalid_argument
{
public:
    explicit InvalidInput(const std::string& message) : std::invalid_argument{message} {}
    InvalidInput(const InvalidInput& exception) = default;
    InvalidInput(InvalidInput&& exception) = default;
};

//-------------------------------------------------------------------------

}  // namespace histsample

//-------------------------------------------------------------------------
