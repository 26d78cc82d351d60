// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SameFile.hxx"
#include "FileAt.hxx"

#include <fcntl.h>
#include <sys/stat.h>

static bool
StatxIdentity(FileAt file, int flags, struct statx &stx) noexcept
{
	return statx(file.directory.Get(), file.name,
		     flags|AT_STATX_SYNC_AS_STAT,
		     STATX_INO, &stx) == 0;
}

bool
IsSameFile(FileAt a, FileAt b, bool follow_symlinks) noexcept
{
	const int flags = follow_symlinks ? 0 : AT_SYMLINK_NOFOLLOW;

	struct statx a_stx, b_stx;
	if (!StatxIdentity(a, flags, a_stx) ||
	    !StatxIdentity(b, flags, b_stx))
		return false;

	return a_stx.stx_ino == b_stx.stx_ino &&
		a_stx.stx_dev_major == b_stx.stx_dev_major &&
		a_stx.stx_dev_minor == b_stx.stx_dev_minor;
}
