// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <stdexcept>

#include <sys/stat.h>
#include <unistd.h>

bool
FileDescriptor::Open(FileDescriptor dir, const char *pathname,
		     int flags, mode_t mode) noexcept
{
	fd = ::openat(dir.Get(), pathname, flags | O_NOCTTY | O_CLOEXEC, mode);
	return IsDefined();
}

bool
FileDescriptor::OpenReadOnly(FileDescriptor dir, const char *pathname) noexcept
{
	return Open(dir, pathname, O_RDONLY);
}

bool
FileDescriptor::Close() noexcept
{
	return ::close(Steal()) == 0;
}

bool
FileDescriptor::Rewind() noexcept
{
	return ::lseek(fd, 0, SEEK_SET) == 0;
}

off_t
FileDescriptor::GetSize() const noexcept
{
	struct stat st;
	return ::fstat(fd, &st) >= 0
		? st.st_size
		: -1;
}

ssize_t
FileDescriptor::Read(std::span<std::byte> dest) const noexcept
{
	return ::read(fd, dest.data(), dest.size());
}

ssize_t
FileDescriptor::ReadAt(off_t offset, void *buffer, std::size_t length) const noexcept
{
	return ::pread(fd, buffer, length, offset);
}

ssize_t
FileDescriptor::Write(std::span<const std::byte> src) const noexcept
{
	return ::write(fd, src.data(), src.size());
}

void
FileDescriptor::FullWrite(std::span<const std::byte> src) const
{
	while (!src.empty()) {
		const ssize_t nbytes = Write(src);
		if (nbytes <= 0) [[unlikely]] {
			if (nbytes < 0)
				throw MakeErrno("Failed to write");

			throw std::runtime_error{"Short write"};
		}

		src = src.subspan(nbytes);
	}
}
