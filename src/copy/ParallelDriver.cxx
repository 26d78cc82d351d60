// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ParallelDriver.hxx"
#include "io/Logger.hxx"

#include <algorithm>

namespace fs = std::filesystem;

namespace XCopy {

static const LLogger logger{"parallel"};

void
ParallelDriver::Fail(StatusSender &status, std::exception_ptr error)
{
	failed.store(true, std::memory_order_relaxed);
	status.Send(ErrorUpdate{std::move(error)});
}

void
ParallelDriver::Finish() noexcept
{
	for (const auto &job : jobs)
		FinishDirectories(job, options);

	logger(3, "Finished");
}

void
ParallelDriver::Run(StatusSender status) noexcept
{
	while (!IsAborted()) {
		const std::size_t i = next_work.fetch_add(1, std::memory_order_relaxed);
		if (i >= work.size())
			break;

		const auto &item = work[i];

		try {
			ExecuteOperation(*item.operation, item.job->destination,
					 options, status);
		} catch (...) {
			const auto error = std::current_exception();

			try {
				Fail(status, error);
			} catch (...) {
				/* the control loop will never see this
				   error; log it and stop all workers */
				logger(1, "Failed to report error",
				       std::current_exception());
				logger(1, "Operation failed", error);
				next_work.store(work.size(),
						std::memory_order_relaxed);
			}
		}
	}

	if (running.fetch_sub(1) == 1)
		/* this is the last worker */
		Finish();

	/* the StatusSender is released here, after Finish() */
}

void
ParallelDriver::Start(std::vector<CopyJob> &&_jobs, StatusSender status)
{
	jobs = std::move(_jobs);
	work.clear();
	next_work = 0;
	failed = false;

	/* create all directories before starting the workers, so
	   each directory exists before anything inside it gets
	   copied */
	for (const auto &job : jobs) {
		logger.Fmt(2, "Copying {} objects to {:?}",
			   job.operations.size(), job.destination.c_str());

		for (const auto &operation : job.operations) {
			if (operation.kind != CopyOperation::Kind::DIRECTORY) {
				work.push_back({&job, &operation});
				continue;
			}

			if (IsAborted())
				continue;

			try {
				ExecuteOperation(operation, job.destination,
						 options, status);
			} catch (...) {
				Fail(status, std::current_exception());
			}
		}
	}

	const std::size_t n = IsAborted()
		? 0
		: std::min<std::size_t>(config.GetWorkerCount(), work.size());
	if (n == 0) {
		Finish();
		return;
	}

	logger.Fmt(3, "Starting {} workers for {} operations", n, work.size());

	running = n;
	threads.reserve(n);

	for (std::size_t i = 0; i < n; ++i) {
		try {
			threads.emplace_back(&ParallelDriver::Run, this, status);
		} catch (...) {
			if (i == 0) {
				running = 0;
				throw;
			}

			/* continue with the workers we have */
			logger(1, "Failed to start worker thread",
			       std::current_exception());

			if (running.fetch_sub(n - i) == n - i)
				/* all workers have finished already */
				Finish();

			break;
		}
	}
}

void
ParallelDriver::CopySingle(const fs::path &source,
			   const fs::path &destination,
			   StatusSender status)
{
	Wait();

	std::vector<CopyJob> new_jobs;
	new_jobs.emplace_back(PlanSingleJob(source, destination, config));
	Start(std::move(new_jobs), std::move(status));
}

void
ParallelDriver::CopyAll(std::span<const fs::path> sources,
			const fs::path &destination,
			StatusSender status)
{
	Wait();

	Start(PlanJobs(sources, destination, config), std::move(status));
}

void
ParallelDriver::Wait() noexcept
{
	for (auto &thread : threads)
		thread.join();

	threads.clear();
}

} // namespace XCopy
