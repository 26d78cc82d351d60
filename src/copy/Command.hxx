// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ControlLoop.hxx"

#include <filesystem>
#include <span>

namespace XCopy {

struct CopyConfig;

/**
 * Copy the given sources to #destination: validate the arguments,
 * create the #Driver, start the copy and run the control loop until
 * it has finished.
 *
 * With one source, #destination is the target path unless it is an
 * existing directory; with more than one source, #destination must
 * be an existing directory.
 *
 * Throws #Error (possibly nested) on failure.
 */
TransferTotals
RunCopy(const CopyConfig &config,
	std::span<const std::filesystem::path> sources,
	const std::filesystem::path &destination,
	ProgressListener &progress);

} // namespace XCopy
