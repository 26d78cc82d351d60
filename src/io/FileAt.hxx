// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "FileDescriptor.hxx"

/**
 * Refers to a file by a directory descriptor and a name relative to
 * it, like the *at() system calls do.  An absolute #name ignores the
 * #directory.
 */
struct FileAt {
	FileDescriptor directory;
	const char *name;

	/**
	 * Construct an instance referring to a path relative to the
	 * current working directory.
	 */
	static constexpr FileAt CurrentDirectory(const char *_name) noexcept {
		return {FileDescriptor::CurrentDirectory(), _name};
	}
};
