// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <string.h>

const char *
StripLeft(const char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;

	return p;
}

void
StripRight(char *p) noexcept
{
	size_t length = strlen(p);

	while (length > 0 && IsWhitespaceOrNull(p[length - 1]))
		--length;

	p[length] = 0;
}
