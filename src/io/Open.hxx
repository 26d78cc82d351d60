// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct FileAt;
class FileDescriptor;
class UniqueFileDescriptor;

/**
 * Open a file read-only.  Throws std::system_error on error.
 *
 * @param flags additional flags for openat(), e.g. O_NOFOLLOW
 */
UniqueFileDescriptor
OpenReadOnly(FileAt file, int flags=0);

UniqueFileDescriptor
OpenReadOnly(const char *path, int flags=0);

/**
 * Open a directory read-only (for reading its entries or as the
 * base of *at() calls).  Throws std::system_error on error.
 */
UniqueFileDescriptor
OpenDirectory(FileAt file, int flags=0);

UniqueFileDescriptor
OpenDirectory(const char *path, int flags=0);

/**
 * Open a file for writing, creating it if necessary.  Throws
 * std::system_error on error.
 *
 * @param flags additional flags for openat(), e.g. O_EXCL or O_TRUNC
 */
UniqueFileDescriptor
OpenWriteOnly(FileAt file, int flags=0, unsigned mode=0666);
