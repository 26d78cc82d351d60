// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"
#include "util/StringParser.hxx"

#include <string.h>

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error("Unexpected tokens at end of line");
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	const std::size_t length = strlen(word);
	if (strncmp(p, word, length) != 0)
		return false;

	if (p[length] != 0 && !IsWhitespaceNotNull(p[length]))
		return false;

	p = StripLeft(p + length);
	return true;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		/* garbage after the word; let the caller fail */
		return nullptr;

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *result = p;
	while (IsUnquotedChar(front()))
		++p;

	if (!IsEnd()) {
		if (!IsWhitespaceNotNull(front()))
			return nullptr;

		*p++ = 0;
		Strip();
	}

	return result;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *const value = p;
	char *const end = strchr(p, stop);
	if (end == nullptr)
		return nullptr;

	*end = 0;
	p = StripLeft(end + 1);
	return value;
}

char *
LineParser::NextValue() noexcept
{
	if (IsEnd())
		return nullptr;

	const char ch = front();
	if (IsQuote(ch)) {
		++p;
		return NextQuotedValue(ch);
	}

	return NextUnquotedValue();
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}

bool
LineParser::ExpectBoolAndEnd()
{
	const bool value = ParseBool(ExpectValue());
	ExpectEnd();
	return value;
}

unsigned
LineParser::ExpectPositiveIntegerAndEnd(unsigned max_value)
{
	const auto value = ParsePositiveLong(ExpectValue(), max_value);
	ExpectEnd();
	return value;
}

std::size_t
LineParser::ExpectSizeAndEnd()
{
	const auto value = ParseSize(ExpectValue());
	ExpectEnd();

	if (value == 0)
		throw Error("Size must not be zero");

	return value;
}
