// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include <sys/types.h>
#include <fcntl.h> // for AT_FDCWD

/**
 * An OO wrapper for a UNIX file descriptor.
 *
 * This class does not have a destructor; the caller is responsible
 * for closing the file descriptor (see #UniqueFileDescriptor).
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;
	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool operator==(FileDescriptor other) const noexcept {
		return fd == other.fd;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Returns the file descriptor.  This may only be called if
	 * IsDefined() returns true.
	 */
	constexpr int Get() const noexcept {
		return fd;
	}

	void Set(int _fd) noexcept {
		fd = _fd;
	}

	int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	void SetUndefined() noexcept {
		fd = -1;
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	/**
	 * The pseudo file descriptor which refers to the current
	 * working directory in the *at() system calls.
	 */
	static constexpr FileDescriptor CurrentDirectory() noexcept {
		return FileDescriptor(AT_FDCWD);
	}

	[[nodiscard]]
	bool Open(FileDescriptor dir, const char *pathname,
		  int flags, mode_t mode=0666) noexcept;

	[[nodiscard]]
	bool Open(const char *pathname, int flags, mode_t mode=0666) noexcept {
		return Open(CurrentDirectory(), pathname, flags, mode);
	}

	[[nodiscard]]
	bool OpenReadOnly(FileDescriptor dir, const char *pathname) noexcept;

	[[nodiscard]]
	bool OpenReadOnly(const char *pathname) noexcept {
		return OpenReadOnly(CurrentDirectory(), pathname);
	}

	/**
	 * Close the file descriptor.  It should not be called on an
	 * "undefined" object.  After this call, IsDefined() is
	 * guaranteed to return false, and this object may be reused.
	 *
	 * @return false on error (check errno)
	 */
	bool Close() noexcept;

	/**
	 * Rewind the pointer to the beginning of the file.
	 */
	bool Rewind() noexcept;

	/**
	 * Returns the size of the file in bytes, or -1 on error.
	 */
	[[gnu::pure]]
	off_t GetSize() const noexcept;

	[[nodiscard]]
	ssize_t Read(std::span<std::byte> dest) const noexcept;

	[[nodiscard]]
	ssize_t ReadAt(off_t offset, void *buffer, std::size_t length) const noexcept;

	[[nodiscard]]
	ssize_t Write(std::span<const std::byte> src) const noexcept;

	/**
	 * Write all of the given buffer, retrying after short writes.
	 *
	 * Throws on error.
	 */
	void FullWrite(std::span<const std::byte> src) const;
};
