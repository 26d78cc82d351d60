// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct FileAt;

/**
 * Do both paths refer to the same file system object (same device
 * and inode)?  Paths which cannot be stat'ed (e.g. because they do
 * not exist) never compare equal.
 *
 * @param follow_symlinks if false, symlinks are compared as
 * themselves and not as the object they point to
 */
[[gnu::pure]]
bool
IsSameFile(FileAt a, FileAt b, bool follow_symlinks=true) noexcept;
