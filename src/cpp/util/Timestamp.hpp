/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------

// Seconds since the Unix epoch.
using Timestamp = uint64_t;

//-------------------------------------------------------------------------
