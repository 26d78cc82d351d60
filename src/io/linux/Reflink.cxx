// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Reflink.hxx"
#include "io/FileDescriptor.hxx"

#include <array>
#include <algorithm>

#include <linux/fs.h> // for FICLONE
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/vfs.h>

/* not all of these are in older <linux/magic.h> versions */
static constexpr std::array reflink_filesystems{
	0x9123683eL, // btrfs
	0x58465342L, // XFS
	0xca451a4eL, // bcachefs
	0x7461636fL, // OCFS2
};

bool
IsReflinkCapable(FileDescriptor src, FileDescriptor dst) noexcept
{
	struct stat src_st, dst_st;
	if (fstat(src.Get(), &src_st) < 0 ||
	    fstat(dst.Get(), &dst_st) < 0 ||
	    src_st.st_dev != dst_st.st_dev)
		/* FICLONE never works across file systems */
		return false;

	struct statfs sfs;
	if (fstatfs(dst.Get(), &sfs) < 0)
		return false;

	return std::find(reflink_filesystems.begin(), reflink_filesystems.end(),
			 static_cast<long>(sfs.f_type)) != reflink_filesystems.end();
}

bool
TryCloneFile(FileDescriptor src, FileDescriptor dst) noexcept
{
	return ioctl(dst.Get(), FICLONE, src.Get()) == 0;
}
