// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "Status.hxx"
#include "io/CopyRegularFile.hxx"

#include <filesystem>

namespace XCopy {

struct CopyOperation;
struct CopyJob;

/**
 * How a driver executes operations; derived from #CopyConfig.
 */
struct ExecuteOptions {
	CopyRegularFileOptions copy;

	/**
	 * Check each source/destination pair with
	 * IsReflinkCapable() and attempt to clone it if the check
	 * succeeds?
	 */
	bool probe_reflink = false;

	bool no_clobber = false;

	bool preserve_metadata = false;

	PartialFilePolicy partial_file_policy = PartialFilePolicy::KEEP;

	ExecuteOptions() = default;

	ExecuteOptions(const CopyConfig &config, DriverKind kind) noexcept;
};

/**
 * Execute one operation: create the directory, copy the file or
 * recreate the symlink at the operation's destination below
 * #destination_root.
 *
 * For a file, one #SizeUpdate followed by #CopiedUpdate messages is
 * sent to #status.  Errors are not sent; they are thrown, nested
 * inside a std::runtime_error which names the operation.
 */
void
ExecuteOperation(const CopyOperation &operation,
		 const std::filesystem::path &destination_root,
		 const ExecuteOptions &options,
		 StatusSender &status);

/**
 * Apply the final mode (and, if metadata is preserved, the time
 * stamps) to the directories of the given job.  This must be called
 * after all other operations of the job have finished, because
 * populating a directory modifies its time stamps, and the final mode
 * may not allow populating it.
 *
 * Failures are logged, not thrown.
 */
void
FinishDirectories(const CopyJob &job, const ExecuteOptions &options) noexcept;

} // namespace XCopy
