// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "io/FileAt.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <array>
#include <cstdint>
#include <span>

#include <fcntl.h>
#include <stdlib.h>

namespace fs = std::filesystem;

TempDirectory::TempDirectory()
{
	std::string pattern = (fs::temp_directory_path() / "xcopy-test-XXXXXX").native();
	if (mkdtemp(pattern.data()) == nullptr)
		throw MakeErrno("mkdtemp() failed");

	path = pattern;
}

TempDirectory::~TempDirectory() noexcept
{
	std::error_code ec;

	/* restore access to directories which tests made
	   inaccessible */
	for (auto i = fs::recursive_directory_iterator(path, ec);
	     !ec && i != fs::recursive_directory_iterator(); i.increment(ec))
		if (i->is_directory(ec) && !i->is_symlink(ec))
			fs::permissions(i->path(), fs::perms::owner_all,
					fs::perm_options::add, ec);

	fs::remove_all(path, ec);
}

void
WriteTextFile(const fs::path &path, std::string_view contents)
{
	const auto fd = OpenWriteOnly(FileAt::CurrentDirectory(path.c_str()),
				      O_CREAT|O_TRUNC);
	fd.FullWrite(std::as_bytes(std::span{contents}));
}

std::string
ReadTextFile(const fs::path &path)
{
	const auto fd = OpenReadOnly(path.c_str());

	std::string result;
	std::array<std::byte, 8192> buffer;

	while (true) {
		const auto nbytes = fd.Read(buffer);
		if (nbytes < 0)
			throw FmtErrno("Failed to read {:?}", path.c_str());

		if (nbytes == 0)
			break;

		result.append(reinterpret_cast<const char *>(buffer.data()),
			      nbytes);
	}

	return result;
}

std::string
MakeTestData(std::size_t size)
{
	std::string result;
	result.reserve(size);

	uint_least32_t state = 0x12345678;
	for (std::size_t i = 0; i < size; ++i) {
		state = state * 1103515245 + 12345;
		result.push_back(static_cast<char>(state >> 16));
	}

	return result;
}
