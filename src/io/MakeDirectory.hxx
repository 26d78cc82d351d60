// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueFileDescriptor.hxx"

#include <filesystem>

#include <sys/types.h>

struct FileAt;

struct MakeDirectoryOptions {
	mode_t mode = 0777;

	/**
	 * Throw an error if the directory already exists?
	 */
	bool exclusive = false;

	/**
	 * Accept an existing symlink pointing to a directory?
	 */
	bool follow_symlinks = false;
};

struct MakeDirectoryResult {
	/**
	 * A read-only handle to the directory.
	 */
	UniqueFileDescriptor fd;

	/**
	 * Was the directory created by this call?  If false, it
	 * existed already and its mode has not been touched.
	 */
	bool created;
};

/**
 * Open a directory, and create it if it does not exist.
 *
 * Throws std::system_error on error.
 *
 * @param mode the mode parameter for the mkdir() call; it has no
 * effect if the directory already exists
 */
MakeDirectoryResult
MakeDirectory(FileAt file,
	      MakeDirectoryOptions options=MakeDirectoryOptions{});

/**
 * Like MakeDirectory(), but create missing parent directories as
 * well.  Parents are created with mode 0777 (minus the umask), and
 * symlinks to directories are followed in them; #options applies
 * only to the last segment.  "." and ".." segments are resolved by
 * the kernel.
 */
MakeDirectoryResult
MakeNestedDirectory(const std::filesystem::path &path,
		    MakeDirectoryOptions options=MakeDirectoryOptions{});
