/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "dealcore/store/Database.hpp"

//-------------------------------------------------------------------------

namespace dealcore::store
{

inline constexpr int64_t kSchemaVersion = 1;

// Idempotent; safe to run on every start.
void applySchema(Database& db);

}  // namespace dealcore::store

//-------------------------------------------------------------------------
