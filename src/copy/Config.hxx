// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <cstdint>

namespace XCopy {

enum class DriverKind : uint_least8_t {
	/**
	 * Execute all operations one at a time on the calling
	 * thread.
	 */
	SEQUENTIAL,

	/**
	 * Execute file operations on a pool of worker threads.
	 */
	PARALLEL,
};

enum class ErrorPolicy : uint_least8_t {
	/**
	 * The first error is fatal for the whole invocation.
	 */
	ABORT,

	/**
	 * Continue with the remaining operations and report all
	 * failures at the end.
	 */
	CONTINUE,
};

/**
 * What happens to a destination file whose copy has failed halfway?
 */
enum class PartialFilePolicy : uint_least8_t {
	KEEP,
	REMOVE,
};

struct CopyConfig {
	static constexpr std::size_t DEFAULT_BLOCK_SIZE = 1024 * 1024;

	static constexpr unsigned MAX_WORKERS = 65536;

	DriverKind driver_kind = DriverKind::PARALLEL;

	ErrorPolicy error_policy = ErrorPolicy::ABORT;

	PartialFilePolicy partial_file_policy = PartialFilePolicy::KEEP;

	/**
	 * The number of worker threads; 0 means the number of CPUs.
	 */
	unsigned parallelism = 0;

	/**
	 * The buffer size for copying file contents.
	 */
	std::size_t block_size = DEFAULT_BLOCK_SIZE;

	bool recursive = false;

	/**
	 * Refuse to overwrite existing destination files?
	 */
	bool no_clobber = false;

	/**
	 * Propagate mode bits, ownership and time stamps?
	 */
	bool preserve_metadata = false;

	/**
	 * Copy the objects symlinks in the source point to instead
	 * of recreating the symlinks?
	 */
	bool dereference = false;

	/**
	 * Returns #parallelism or, if that is zero, a value derived
	 * from the hardware concurrency.
	 */
	[[gnu::pure]]
	unsigned GetWorkerCount() const noexcept;
};

[[gnu::const]]
const char *
ToString(DriverKind kind) noexcept;

/**
 * Throws std::invalid_argument if the name is not known.
 */
DriverKind
ParseDriverKind(const char *s);

ErrorPolicy
ParseErrorPolicy(const char *s);

PartialFilePolicy
ParsePartialFilePolicy(const char *s);

} // namespace XCopy
