// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Driver.hxx"
#include "Config.hxx"
#include "Execute.hxx"

namespace XCopy {

struct CopyJob;

/**
 * A #Driver which executes all operations one after another on the
 * calling thread.  CopySingle() and CopyAll() return after
 * everything has been copied.
 */
class SequentialDriver final : public Driver {
	const CopyConfig config;
	const ExecuteOptions options;

public:
	explicit SequentialDriver(const CopyConfig &_config) noexcept
		:config(_config),
		 options(_config, DriverKind::SEQUENTIAL) {}

	/* virtual methods from class Driver */
	void CopySingle(const std::filesystem::path &source,
			const std::filesystem::path &destination,
			StatusSender status) override;
	void CopyAll(std::span<const std::filesystem::path> sources,
		     const std::filesystem::path &destination,
		     StatusSender status) override;

private:
	/**
	 * Execute all operations of the given job.
	 *
	 * @return false if an operation has failed and the
	 * #ErrorPolicy says no more operations shall be executed
	 */
	bool Run(const CopyJob &job, StatusSender &status);
};

} // namespace XCopy
