// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string_view>
#include <utility>

namespace LoggerDetail {

extern unsigned max_level;

inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

void
Write(std::string_view domain, std::string_view msg) noexcept;

void
Fmt(unsigned level, std::string_view domain,
    fmt::string_view format_str, fmt::format_args args) noexcept;

} /* namespace LoggerDetail */

inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

template<typename Domain>
class BasicLogger : public Domain {
public:
	BasicLogger() = default;

	template<typename D>
	explicit BasicLogger(D &&_domain)
		:Domain(std::forward<D>(_domain)) {}

	static bool CheckLevel(unsigned level) noexcept {
		return LoggerDetail::CheckLevel(level);
	}

	void operator()(unsigned level, std::string_view msg) const noexcept {
		if (CheckLevel(level))
			LoggerDetail::Write(GetDomain(), msg);
	}

	/**
	 * Log the full message of the given exception (including
	 * its nested exceptions).
	 */
	void operator()(unsigned level, std::string_view prefix,
			std::exception_ptr ep) const noexcept;

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::Fmt(level, GetDomain(), format_str,
				  fmt::make_format_args(args...));
	}

	std::string_view GetDomain() const noexcept {
		return Domain::GetDomain();
	}
};

namespace LoggerDetail {

void
WriteException(std::string_view domain, std::string_view prefix,
	       std::exception_ptr ep) noexcept;

} /* namespace LoggerDetail */

template<typename Domain>
inline void
BasicLogger<Domain>::operator()(unsigned level, std::string_view prefix,
				std::exception_ptr ep) const noexcept
{
	if (CheckLevel(level))
		LoggerDetail::WriteException(GetDomain(), prefix, std::move(ep));
}

/**
 * A logger domain which is a string literal (or any other string
 * which outlives the logger).
 */
class LiteralLoggerDomain {
	std::string_view domain;

public:
	constexpr explicit LiteralLoggerDomain(std::string_view _domain={}) noexcept
		:domain(_domain) {}

	constexpr std::string_view GetDomain() const noexcept {
		return domain;
	}
};

/**
 * A logger with a constant domain, usually declared as a static
 * variable at the top of a source file.
 */
class LLogger : public BasicLogger<LiteralLoggerDomain> {
public:
	LLogger() = default;

	template<typename D>
	explicit LLogger(D &&_domain) noexcept
		:BasicLogger(std::forward<D>(_domain)) {}
};
