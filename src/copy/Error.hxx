// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace XCopy {

enum class ErrorKind : uint_least8_t {
	/**
	 * The command line is malformed.
	 */
	INVALID_ARGUMENTS,

	/**
	 * A source does not exist, is a directory while recursion is
	 * disabled, or would be copied into itself.
	 */
	INVALID_SOURCE,

	/**
	 * The destination is not usable for the given sources.
	 */
	INVALID_DESTINATION,

	/**
	 * The destination exists and must not be overwritten.
	 */
	DESTINATION_EXISTS,

	/**
	 * A system call failed (see the nested std::system_error).
	 */
	IO,

	/**
	 * The status channel protocol was violated.  This is a bug.
	 */
	CHANNEL,

	/**
	 * One or more operations have failed, but the others were
	 * completed (ErrorPolicy::CONTINUE).
	 */
	PARTIAL_FAILURE,

	/**
	 * Any other error.
	 */
	OTHER,
};

class Error : public std::runtime_error {
	ErrorKind kind;

public:
	Error(ErrorKind _kind, const char *_msg)
		:std::runtime_error(_msg), kind(_kind) {}

	Error(ErrorKind _kind, const std::string &_msg)
		:std::runtime_error(_msg), kind(_kind) {}

	ErrorKind GetKind() const noexcept {
		return kind;
	}
};

/**
 * Determine the #ErrorKind of the given exception.  The nested
 * chain is searched for an #Error instance first, then for a
 * std::system_error (#ErrorKind::IO).
 */
[[gnu::pure]]
ErrorKind
GetErrorKind(std::exception_ptr ep) noexcept;

[[gnu::const]]
const char *
ToString(ErrorKind kind) noexcept;

} // namespace XCopy
