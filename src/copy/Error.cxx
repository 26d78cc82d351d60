// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"
#include "util/Exception.hxx"

#include <system_error>

namespace XCopy {

ErrorKind
GetErrorKind(std::exception_ptr ep) noexcept
{
	if (const auto *e = FindNested<Error>(ep))
		return e->GetKind();

	if (FindNested<std::system_error>(ep) != nullptr)
		return ErrorKind::IO;

	return ErrorKind::OTHER;
}

const char *
ToString(ErrorKind kind) noexcept
{
	switch (kind) {
	case ErrorKind::INVALID_ARGUMENTS:
		return "invalid arguments";

	case ErrorKind::INVALID_SOURCE:
		return "invalid source";

	case ErrorKind::INVALID_DESTINATION:
		return "invalid destination";

	case ErrorKind::DESTINATION_EXISTS:
		return "destination exists";

	case ErrorKind::IO:
		return "I/O error";

	case ErrorKind::CHANNEL:
		return "channel error";

	case ErrorKind::PARTIAL_FAILURE:
		return "partial failure";

	case ErrorKind::OTHER:
		break;
	}

	return "error";
}

} // namespace XCopy
