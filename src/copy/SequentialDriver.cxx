// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SequentialDriver.hxx"
#include "Planner.hxx"
#include "io/Logger.hxx"

namespace fs = std::filesystem;

namespace XCopy {

static const LLogger logger{"sequential"};

bool
SequentialDriver::Run(const CopyJob &job, StatusSender &status)
{
	logger.Fmt(2, "Copying {} objects to {:?}",
		   job.operations.size(), job.destination.c_str());

	bool result = true;

	for (const auto &operation : job.operations) {
		try {
			ExecuteOperation(operation, job.destination,
					 options, status);
		} catch (...) {
			status.Send(ErrorUpdate{std::current_exception()});

			if (config.error_policy == ErrorPolicy::ABORT) {
				result = false;
				break;
			}
		}
	}

	FinishDirectories(job, options);
	return result;
}

void
SequentialDriver::CopySingle(const fs::path &source,
			     const fs::path &destination,
			     StatusSender status)
{
	const auto job = PlanSingleJob(source, destination, config);
	Run(job, status);
}

void
SequentialDriver::CopyAll(std::span<const fs::path> sources,
			  const fs::path &destination,
			  StatusSender status)
{
	const auto jobs = PlanJobs(sources, destination, config);

	for (const auto &job : jobs)
		if (!Run(job, status))
			break;
}

} // namespace XCopy
