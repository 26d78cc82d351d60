// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CopyRegularFile.hxx"
#include "FileDescriptor.hxx"
#include "io/linux/Reflink.hxx"
#include "lib/fmt/SystemError.hxx"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <fcntl.h> // for posix_fadvise(), fallocate()
#include <unistd.h> // for copy_file_range()

static constexpr std::size_t
NextChunk(off_t size, std::size_t block_size) noexcept
{
	return static_cast<std::size_t>(std::min<off_t>(size, block_size));
}

/**
 * Throws on error.
 *
 * @return true on success (all data has been copied), false if
 * copy_file_range() is not supported (no data has been copied)
 */
static bool
CopyFileRange(FileDescriptor src, FileDescriptor dst, off_t size,
	      std::size_t block_size, CopyRegularFileHandler &handler)
{
	/* check if copy_file_range() works */
	auto nbytes = copy_file_range(src.Get(), nullptr, dst.Get(), nullptr,
				      NextChunk(size, block_size), 0);
	if (nbytes <= 0)
		/* nah */
		return false;

	/* hooray, copy_file_range() works */
	size -= nbytes;
	handler.OnCopyProgress(nbytes);

	while (size > 0) {
		nbytes = copy_file_range(src.Get(), nullptr,
					 dst.Get(), nullptr,
					 NextChunk(size, block_size), 0);
		if (nbytes <= 0) [[unlikely]] {
			if (nbytes == 0)
				throw std::runtime_error{"Unexpected end of file"};

			throw MakeErrno("Failed to copy file data");
		}

		size -= nbytes;
		handler.OnCopyProgress(nbytes);
	}

	return true;
}

static void
ReadWriteCopy(FileDescriptor src, FileDescriptor dst, off_t size,
	      std::size_t block_size, CopyRegularFileHandler &handler)
{
	posix_fadvise(src.Get(), 0, size, POSIX_FADV_SEQUENTIAL);

	fallocate(dst.Get(), FALLOC_FL_KEEP_SIZE, 0, size);

	const std::size_t buffer_size = NextChunk(size, block_size);
	const auto buffer = std::make_unique<std::byte[]>(buffer_size);

	while (size > 0) {
		const auto nbytes1 =
			src.Read({buffer.get(), NextChunk(size, buffer_size)});
		if (nbytes1 <= 0) [[unlikely]] {
			if (nbytes1 == 0)
				throw std::runtime_error{"Unexpected end of file"};

			throw MakeErrno("Failed to read file");
		}

		dst.FullWrite({buffer.get(), static_cast<std::size_t>(nbytes1)});

		size -= nbytes1;
		handler.OnCopyProgress(nbytes1);
	}
}

CopyMethod
CopyRegularFile(FileDescriptor src, FileDescriptor dst, off_t size,
		const CopyRegularFileOptions &options,
		CopyRegularFileHandler &handler)
{
	if (size <= 0)
		return CopyMethod::NONE;

	const std::size_t block_size = std::max<std::size_t>(options.block_size, 1);

	if (options.clone && TryCloneFile(src, dst)) {
		handler.OnCopyProgress(size);
		return CopyMethod::CLONE;
	}

	if (options.copy_file_range &&
	    CopyFileRange(src, dst, size, block_size, handler))
		return CopyMethod::COPY_FILE_RANGE;

	ReadWriteCopy(src, dst, size, block_size, handler);
	return CopyMethod::READ_WRITE;
}
