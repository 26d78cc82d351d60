// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Status.hxx"

#include <filesystem>
#include <memory>
#include <span>

namespace XCopy {

struct CopyConfig;

/**
 * Plans and executes copies.  Planning happens synchronously inside
 * CopySingle() and CopyAll(); planning errors are thrown to the
 * caller before anything is modified.  Execution errors are sent as
 * #ErrorUpdate to the given #StatusSender, which the driver releases
 * once all of its operations have finished.
 */
class Driver {
public:
	virtual ~Driver() noexcept = default;

	/**
	 * Copy #source to exactly #destination.
	 */
	virtual void CopySingle(const std::filesystem::path &source,
				const std::filesystem::path &destination,
				StatusSender status) = 0;

	/**
	 * Copy each source into #destination; see GetTargetPath().
	 */
	virtual void CopyAll(std::span<const std::filesystem::path> sources,
			     const std::filesystem::path &destination,
			     StatusSender status) = 0;

	/**
	 * Wait until all operations have finished.  Drivers which
	 * execute on the calling thread have nothing to wait for.
	 */
	virtual void Wait() noexcept {}
};

/**
 * Create the #Driver selected by CopyConfig::driver_kind.
 */
std::unique_ptr<Driver>
MakeDriver(const CopyConfig &config);

} // namespace XCopy
