// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Operation.hxx"

namespace XCopy {

const char *
ToString(CopyOperation::Kind kind) noexcept
{
	switch (kind) {
	case CopyOperation::Kind::FILE:
		return "file";

	case CopyOperation::Kind::DIRECTORY:
		return "directory";

	case CopyOperation::Kind::SYMLINK:
		return "symlink";
	}

	return "?";
}

} // namespace XCopy
