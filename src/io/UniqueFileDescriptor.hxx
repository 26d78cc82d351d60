// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "FileDescriptor.hxx"

#include <utility>

/**
 * An OO wrapper for a UNIX file descriptor which owns it and closes
 * it automatically in the destructor.
 */
class UniqueFileDescriptor : public FileDescriptor {
public:
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	explicit UniqueFileDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	explicit UniqueFileDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

	UniqueFileDescriptor(const UniqueFileDescriptor &) = delete;

	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(other.Steal()) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			FileDescriptor::Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	[[nodiscard]]
	bool Open(FileDescriptor dir, const char *pathname,
		  int flags, mode_t mode=0666) noexcept {
		Reset();
		return FileDescriptor::Open(dir, pathname, flags, mode);
	}

	[[nodiscard]]
	bool Open(const char *pathname, int flags, mode_t mode=0666) noexcept {
		Reset();
		return FileDescriptor::Open(pathname, flags, mode);
	}

	[[nodiscard]]
	bool OpenReadOnly(FileDescriptor dir, const char *pathname) noexcept {
		Reset();
		return FileDescriptor::OpenReadOnly(dir, pathname);
	}

	[[nodiscard]]
	bool OpenReadOnly(const char *pathname) noexcept {
		Reset();
		return FileDescriptor::OpenReadOnly(pathname);
	}

	bool Close() noexcept {
		return IsDefined() && FileDescriptor::Close();
	}

private:
	void Reset() noexcept {
		if (IsDefined())
			FileDescriptor::Close();
	}
};
