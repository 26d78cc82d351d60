// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DirectoryReader.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <algorithm>
#include <utility>

#include <errno.h>

[[gnu::pure]]
static constexpr bool
IsSpecialFilename(const char *s) noexcept
{
	return s[0] == '.' && (s[1] == 0 || (s[1] == '.' && s[2] == 0));
}

DirectoryReader::DirectoryReader(const char *path)
	:dir(opendir(path))
{
	if (dir == nullptr)
		throw FmtErrno("Failed to open directory {:?}", path);
}

static DIR *
OpenDir(UniqueFileDescriptor &&fd)
{
	auto dir = fdopendir(fd.Get());
	if (dir == nullptr)
		throw MakeErrno("Failed to reopen directory");

	fd.Steal();
	return dir;
}

DirectoryReader::DirectoryReader(UniqueFileDescriptor &&fd)
	:dir(OpenDir(std::move(fd))) {}

const char *
DirectoryReader::Read()
{
	while (true) {
		/* readdir() returns nullptr both at the end and on
		   error; only errno tells them apart */
		errno = 0;
		const auto *ent = readdir(dir);
		if (ent == nullptr) {
			if (errno != 0)
				throw MakeErrno("Failed to read directory");

			return nullptr;
		}

		if (!IsSpecialFilename(ent->d_name))
			return ent->d_name;
	}
}

std::vector<std::string>
DirectoryReader::ReadSortedNames()
{
	std::vector<std::string> names;
	while (const char *name = Read())
		names.emplace_back(name);

	std::sort(names.begin(), names.end());
	return names;
}

FileDescriptor
DirectoryReader::GetFileDescriptor() const noexcept
{
	return FileDescriptor(dirfd(dir));
}
