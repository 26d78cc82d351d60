// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <sys/types.h>
#include <time.h>

namespace XCopy {

/**
 * The attributes of a source object which may be propagated to the
 * destination.
 */
struct FileMetadata {
	mode_t mode = 0;
	uid_t uid = 0;
	gid_t gid = 0;
	struct timespec atime{}, mtime{};
};

/**
 * One unit of planned work: create a directory, copy a file or
 * recreate a symlink.
 */
struct CopyOperation {
	enum class Kind : uint_least8_t {
		FILE,
		DIRECTORY,
		SYMLINK,
	};

	Kind kind;

	/**
	 * The path of the source object.
	 */
	std::filesystem::path source_path;

	/**
	 * The path relative to the destination root.  It is empty
	 * for the root itself.
	 */
	std::filesystem::path relative_path;

	/**
	 * The size of the file in bytes (only #Kind::FILE).
	 */
	uint_least64_t size = 0;

	/**
	 * The symlink target, verbatim (only #Kind::SYMLINK).
	 */
	std::string link_target;

	FileMetadata metadata;

	/**
	 * Determine the destination path of this operation below the
	 * given destination root.
	 */
	std::filesystem::path GetDestination(const std::filesystem::path &root) const {
		return relative_path.empty()
			? root
			: root / relative_path;
	}
};

[[gnu::const]]
const char *
ToString(CopyOperation::Kind kind) noexcept;

} // namespace XCopy
