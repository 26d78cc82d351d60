// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <cstdint>

#include <sys/types.h> // for off_t

class FileDescriptor;

/**
 * Receives progress notifications from CopyRegularFile().
 */
class CopyRegularFileHandler {
public:
	/**
	 * The given number of bytes has been written to the
	 * destination.  The sum of all calls equals the size passed
	 * to CopyRegularFile() if it returns normally.
	 */
	virtual void OnCopyProgress(std::size_t nbytes) = 0;
};

struct CopyRegularFileOptions {
	/**
	 * The maximum amount of data copied in one step; progress is
	 * reported after each step.
	 */
	std::size_t block_size = 1024 * 1024;

	/**
	 * Attempt to clone the file (FICLONE) before copying data?
	 * The caller should enable this only if the file system
	 * supports it (see IsReflinkCapable()).
	 */
	bool clone = false;

	/**
	 * Attempt to let the kernel copy the data with
	 * copy_file_range()?
	 */
	bool copy_file_range = true;
};

enum class CopyMethod : uint_least8_t {
	NONE,
	CLONE,
	COPY_FILE_RANGE,
	READ_WRITE,
};

/**
 * Copy #size bytes from one file to the other.  Both file
 * descriptors must be at offset 0.
 *
 * Throws on error.
 *
 * @return the method which was used to copy the data
 */
CopyMethod
CopyRegularFile(FileDescriptor src, FileDescriptor dst, off_t size,
		const CopyRegularFileOptions &options,
		CopyRegularFileHandler &handler);
