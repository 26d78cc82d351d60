// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MakeDirectory.hxx"
#include "FileAt.hxx"
#include "lib/fmt/SystemError.hxx"

#include <iterator>

#include <fcntl.h>
#include <sys/stat.h>

static UniqueFileDescriptor
OpenDirectory(FileAt file, bool follow_symlinks)
{
	int flags = O_DIRECTORY|O_RDONLY;
	if (!follow_symlinks)
		flags |= O_NOFOLLOW;

	UniqueFileDescriptor fd;
	if (!fd.Open(file.directory, file.name, flags))
		throw FmtErrno("Failed to open directory {:?}", file.name);

	return fd;
}

MakeDirectoryResult
MakeDirectory(FileAt file, const MakeDirectoryOptions options)
{
	bool created = true;

	if (mkdirat(file.directory.Get(), file.name, options.mode) < 0) {
		const int e = errno;
		if (e != EEXIST || options.exclusive)
			throw FmtErrno(e, "Failed to create directory {:?}",
				       file.name);

		/* it exists already; OpenDirectory() will check
		   whether it is really a directory */
		created = false;
	}

	return {OpenDirectory(file, options.follow_symlinks), created};
}

MakeDirectoryResult
MakeNestedDirectory(const std::filesystem::path &path,
		    const MakeDirectoryOptions options)
{
	if (path.empty())
		throw MakeErrno(ENOENT, "Empty directory path");

	/* fast path: the parent exists already */
	if (mkdirat(AT_FDCWD, path.c_str(), options.mode) == 0)
		return {OpenDirectory(FileAt::CurrentDirectory(path.c_str()),
				      options.follow_symlinks),
			true};

	if (const int e = errno; e != ENOENT)
		return MakeDirectory(FileAt::CurrentDirectory(path.c_str()),
				     options);

	/* walk down from the root (or the current directory), one
	   segment at a time */
	const auto stripped = path.has_filename() ? path : path.parent_path();

	UniqueFileDescriptor parent;
	FileDescriptor parent_fd = FileDescriptor::CurrentDirectory();

	auto i = stripped.begin();
	if (stripped.has_root_directory()) {
		if (!parent.Open("/", O_DIRECTORY|O_RDONLY))
			throw MakeErrno("Failed to open root directory");
		parent_fd = parent;
		++i;
	}

	const MakeDirectoryOptions middle_options{
		.follow_symlinks = true,
	};

	for (; i != stripped.end(); ++i) {
		const FileAt file{parent_fd, i->c_str()};
		if (std::next(i) == stripped.end())
			return MakeDirectory(file, options);

		parent = MakeDirectory(file, middle_options).fd;
		parent_fd = parent;
	}

	throw MakeErrno(ENOENT, "Empty directory path");
}
