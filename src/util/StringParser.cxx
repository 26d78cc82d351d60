// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringParser.hxx"
#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <string.h>

bool
ParseBool(const char *s)
{
	if (strcmp(s, "yes") == 0 || strcmp(s, "true") == 0)
		return true;
	else if (strcmp(s, "no") == 0 || strcmp(s, "false") == 0)
		return false;
	else
		throw std::invalid_argument("Failed to parse boolean; \"yes\" or \"no\" expected");
}

unsigned long
ParsePositiveLong(const char *s, unsigned long max_value)
{
	/* strtoul() silently accepts a minus sign */
	if (!IsDigitASCII(*s))
		throw std::invalid_argument("Failed to parse integer");

	char *endptr;
	const auto value = std::strtoul(s, &endptr, 10);
	if (*endptr != 0)
		throw std::invalid_argument("Failed to parse integer");

	if (value == 0)
		throw std::invalid_argument("Value must be positive");

	if (value > max_value)
		throw std::invalid_argument("Value is too large");

	return value;
}

template<uint_least64_t OPERAND>
static uint_least64_t
Multiply(uint_least64_t value)
{
	static constexpr uint_least64_t MAX_VALUE =
		std::numeric_limits<uint_least64_t>::max() / OPERAND;
	if (value > MAX_VALUE)
		throw std::invalid_argument("Value too large");

	return value * OPERAND;
}

uint_least64_t
ParseSize(const char *s)
{
	if (!IsDigitASCII(*s))
		throw std::invalid_argument("Failed to parse integer");

	char *endptr;
	uint_least64_t value = std::strtoull(s, &endptr, 10);

	static constexpr uint_least64_t KILO = 1024;
	static constexpr uint_least64_t MEGA = 1024 * KILO;
	static constexpr uint_least64_t GIGA = 1024 * MEGA;

	s = StripLeft(endptr);

	switch (*s) {
	case 'k':
	case 'K':
		value = Multiply<KILO>(value);
		++s;
		break;

	case 'm':
	case 'M':
		value = Multiply<MEGA>(value);
		++s;
		break;

	case 'g':
	case 'G':
		value = Multiply<GIGA>(value);
		++s;
		break;

	case '\0':
		break;

	default:
		throw std::invalid_argument("Unknown size suffix");
	}

	/* ignore 'B' for "byte" */
	if (*s == 'B')
		++s;

	if (*s != '\0')
		throw std::invalid_argument("Unknown size suffix");

	return value;
}
