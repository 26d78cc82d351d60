// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "copy/Config.hxx"

#include <cstddef>
#include <optional>
#include <vector>

namespace XCopy {

/**
 * The parsed command line.  Options which were not given are left
 * unset, so they do not override settings from the configuration
 * file.
 */
struct CommandLine {
	/**
	 * The source patterns followed by the destination.
	 */
	std::vector<const char *> paths;

	const char *config_path = nullptr;

	/**
	 * The number of "--verbose" options.
	 */
	unsigned verbose = 0;

	std::optional<DriverKind> driver_kind;
	std::optional<unsigned> parallelism;
	std::optional<std::size_t> block_size;

	bool recursive = false;
	bool no_clobber = false;
	bool preserve_metadata = false;
	bool dereference = false;
	bool keep_going = false;
	bool remove_partial = false;

	bool progress = true;

	bool help = false;

	/**
	 * Apply all options which were given to #config.
	 */
	void ApplyTo(CopyConfig &config) const noexcept;
};

/**
 * Throws #Error with ErrorKind::INVALID_ARGUMENTS on error.
 */
CommandLine
ParseCommandLine(int argc, char **argv);

void
PrintUsage(const char *program);

} // namespace XCopy
