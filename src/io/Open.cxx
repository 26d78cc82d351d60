// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Open.hxx"
#include "FileAt.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fcntl.h>

UniqueFileDescriptor
OpenReadOnly(FileAt file, int flags)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(file.directory, file.name, O_RDONLY|flags))
		throw FmtErrno("Failed to open {:?}", file.name);

	return fd;
}

UniqueFileDescriptor
OpenReadOnly(const char *path, int flags)
{
	return OpenReadOnly(FileAt::CurrentDirectory(path), flags);
}

UniqueFileDescriptor
OpenDirectory(FileAt file, int flags)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(file.directory, file.name, O_DIRECTORY|O_RDONLY|flags))
		throw FmtErrno("Failed to open directory {:?}", file.name);

	return fd;
}

UniqueFileDescriptor
OpenDirectory(const char *path, int flags)
{
	return OpenDirectory(FileAt::CurrentDirectory(path), flags);
}

UniqueFileDescriptor
OpenWriteOnly(FileAt file, int flags, unsigned mode)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(file.directory, file.name, O_CREAT|O_WRONLY|flags, mode))
		throw FmtErrno("Failed to create {:?}", file.name);

	return fd;
}
