// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Operation.hxx"

#include <filesystem>
#include <span>
#include <vector>

namespace XCopy {

struct CopyConfig;

struct PlanOptions {
	bool recursive = false;

	/**
	 * Plan the objects symlinks point to instead of the symlinks
	 * themselves.
	 */
	bool dereference = false;
};

/**
 * The planned operations for one source, together with the
 * destination they are relative to.
 */
struct CopyJob {
	std::filesystem::path destination;
	std::vector<CopyOperation> operations;
};

/**
 * Walk the given source and produce the operations which are
 * necessary to reproduce it at #destination.  The traversal is
 * depth-first, and each directory operation precedes all operations
 * below it.  Entries of a directory are visited in lexicographical
 * order.
 *
 * No file system object is modified.
 *
 * Throws #Error with #ErrorKind::INVALID_SOURCE if the source does
 * not exist, if it is a directory but recursion is disabled, or if
 * it would be copied into itself; throws std::system_error on I/O
 * errors.
 */
std::vector<CopyOperation>
PlanCopy(const std::filesystem::path &source,
	 const std::filesystem::path &destination,
	 PlanOptions options);

/**
 * Refuse to copy a source onto itself.  Paths which do not exist are
 * not checked.
 *
 * Throws #Error with #ErrorKind::INVALID_SOURCE if #source is a
 * directory and #destination is the directory itself or inside it;
 * throws #Error with #ErrorKind::DESTINATION_EXISTS if #source is not
 * a directory and #destination refers to the same object.
 */
void
CheckNotSameObject(const std::filesystem::path &source, bool is_directory,
		   const std::filesystem::path &destination);

/**
 * Determine where a source gets copied when #destination is the
 * target of a multi-source copy: below the destination if it is an
 * existing directory, else the destination itself.
 */
std::filesystem::path
GetTargetPath(const std::filesystem::path &source,
	      const std::filesystem::path &destination);

/**
 * Plan copying #source to exactly #destination.
 */
CopyJob
PlanSingleJob(const std::filesystem::path &source,
	      const std::filesystem::path &destination,
	      const CopyConfig &config);

/**
 * Plan copying all sources into #destination (see GetTargetPath()).
 * All sources are planned before this function returns, so an
 * invalid source fails the whole set before anything is copied.
 */
std::vector<CopyJob>
PlanJobs(std::span<const std::filesystem::path> sources,
	 const std::filesystem::path &destination,
	 const CopyConfig &config);

} // namespace XCopy
