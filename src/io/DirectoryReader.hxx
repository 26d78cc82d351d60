// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <vector>

#include <dirent.h>

class FileDescriptor;
class UniqueFileDescriptor;

/**
 * Reads the entries of a directory.  The special entries "." and
 * ".." are skipped.
 */
class DirectoryReader {
	DIR *const dir;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit DirectoryReader(const char *path);
	explicit DirectoryReader(UniqueFileDescriptor &&fd);

	DirectoryReader(const DirectoryReader &) = delete;

	~DirectoryReader() noexcept {
		closedir(dir);
	}

	DirectoryReader &operator=(const DirectoryReader &) = delete;

	/**
	 * Returns the name of the next entry or nullptr at the end of
	 * the directory.
	 *
	 * Throws std::system_error on error.
	 */
	const char *Read();

	/**
	 * Read all remaining entry names and return them sorted
	 * bytewise, which makes the result independent of the
	 * filesystem's readdir() order.
	 *
	 * Throws std::system_error on error.
	 */
	std::vector<std::string> ReadSortedNames();

	[[gnu::pure]]
	FileDescriptor GetFileDescriptor() const noexcept;
};
