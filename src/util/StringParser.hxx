// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * Parse a bool represented by "yes"/"no" or "true"/"false"; throws
 * std::invalid_argument on error.
 */
bool
ParseBool(const char *s);

/**
 * Parse a positive decimal integer not larger than #max_value.
 *
 * Throws std::invalid_argument on error.
 */
unsigned long
ParsePositiveLong(const char *s, unsigned long max_value);

/**
 * Parse a string as a byte size with an optional binary suffix
 * ("k", "M" or "G", optionally followed by "B").
 *
 * Throws std::invalid_argument on error.
 */
uint_least64_t
ParseSize(const char *s);
