// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class FileDescriptor;

/**
 * Check whether the two files are on the same file system instance
 * and that file system type is known to implement FICLONE (btrfs,
 * XFS, bcachefs, OCFS2).
 */
[[gnu::pure]]
bool
IsReflinkCapable(FileDescriptor src, FileDescriptor dst) noexcept;

/**
 * Attempt to make #dst share the data blocks of #src (FICLONE).
 *
 * @return true on success, false if the kernel refused (no data has
 * been copied; errno is set)
 */
bool
TryCloneFile(FileDescriptor src, FileDescriptor dst) noexcept;
