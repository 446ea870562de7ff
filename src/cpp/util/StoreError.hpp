/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace dealcore
{

class StoreError : public std::runtime_error
{
public:
    StoreError(const std::string& message) : std::runtime_error(message) {}
    StoreError(const StoreError& exception) = default;
    StoreError(StoreError&& exception) = default;
};

}  // namespace dealcore

//-------------------------------------------------------------------------
