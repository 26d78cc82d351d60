// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <system_error> // IWYU pragma: export
#include <utility>

#include <errno.h>

[[nodiscard]] [[gnu::pure]]
std::system_error
VFmtSystemError(std::error_code code,
		fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtSystemError(std::error_code code,
	       const S &format_str, Args&&... args) noexcept
{
	return VFmtSystemError(code, format_str,
			       fmt::make_format_args(args...));
}

[[nodiscard]] [[gnu::pure]]
inline std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept
{
	return VFmtSystemError(std::error_code(code, std::system_category()),
			       format_str, args);
}

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}

/**
 * Like FmtErrno(int, ...), but uses the current value of errno.
 */
template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	return FmtErrno(errno, format_str, std::forward<Args>(args)...);
}

[[nodiscard]] [[gnu::pure]]
inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(std::error_code(code, std::system_category()),
				 msg);
}

[[nodiscard]] [[gnu::pure]]
inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

/**
 * Does this exception carry the given errno value?
 */
[[gnu::pure]]
inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == std::system_category() &&
		e.code().value() == code;
}
