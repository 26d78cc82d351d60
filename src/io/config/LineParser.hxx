// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/StringStrip.hxx"
#include "util/CharUtil.hxx"

#include <cstddef>
#include <stdexcept>

/**
 * Splits one (mutable) line of a "NAME VALUE" configuration file into
 * tokens.  The parser modifies the buffer: each token is
 * null-terminated in place.
 */
class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	explicit LineParser(char *_p) noexcept
		:p(StripLeft(_p))
	{
		StripRight(p);
	}

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	void ExpectEnd();

	/**
	 * If the next word matches the given parameter, then skip it and
	 * return true.  If not, the method returns false, leaving the
	 * object unmodified.
	 */
	bool SkipWord(const char *word) noexcept;

	/**
	 * Parse a setting name: letters, digits and underscores.
	 *
	 * @return nullptr if there is no such word or if it is
	 * followed by something other than whitespace
	 */
	const char *NextWord() noexcept;

	/**
	 * Parse a value which may be quoted with single or double
	 * quotes.  An unquoted value may contain letters, digits and
	 * the characters "_.-:/".
	 *
	 * @return nullptr on syntax error or at the end of the line
	 */
	char *NextValue() noexcept;

	const char *ExpectWord();

	/**
	 * Expect a non-empty value.
	 */
	char *ExpectValue();

	/**
	 * Expect a non-empty value and end-of-line.
	 */
	char *ExpectValueAndEnd();

	/**
	 * Expect "yes" or "no" (and similar) and end-of-line.
	 */
	bool ExpectBoolAndEnd();

	/**
	 * Expect a positive integer not larger than #max_value and
	 * end-of-line.
	 */
	unsigned ExpectPositiveIntegerAndEnd(unsigned max_value);

	/**
	 * Expect a non-zero byte count (with an optional "k", "M" or
	 * "G" suffix) and end-of-line.
	 */
	std::size_t ExpectSizeAndEnd();

private:
	void Strip() noexcept {
		p = StripLeft(p);
	}

	char *NextUnquotedValue() noexcept;
	char *NextQuotedValue(char stop) noexcept;

	static constexpr bool IsWordChar(char ch) noexcept {
		return IsAlphaNumericASCII(ch) || ch == '_';
	}

	static constexpr bool IsUnquotedChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':' ||
			ch == '/';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
