// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Driver.hxx"
#include "Config.hxx"
#include "Execute.hxx"
#include "Planner.hxx"

#include <atomic>
#include <exception>
#include <thread>
#include <vector>

namespace XCopy {

/**
 * A #Driver which creates all directories on the calling thread and
 * then copies files and symlinks on a pool of worker threads.
 * CopySingle() and CopyAll() return as soon as the workers have been
 * started; Wait() (or the destructor) joins them.
 */
class ParallelDriver final : public Driver {
	const CopyConfig config;
	const ExecuteOptions options;

	std::vector<CopyJob> jobs;

	struct WorkItem {
		const CopyJob *job;
		const CopyOperation *operation;
	};

	/**
	 * All non-directory operations of all #jobs.
	 */
	std::vector<WorkItem> work;

	/**
	 * The index of the next #work item to be taken by a worker.
	 */
	std::atomic_size_t next_work{0};

	/**
	 * The number of workers which have not yet finished.
	 */
	std::atomic_uint running{0};

	/**
	 * Has any operation failed?
	 */
	std::atomic_bool failed{false};

	std::vector<std::thread> threads;

public:
	explicit ParallelDriver(const CopyConfig &_config) noexcept
		:config(_config),
		 options(_config, DriverKind::PARALLEL) {}

	~ParallelDriver() noexcept override {
		Wait();
	}

	ParallelDriver(const ParallelDriver &) = delete;
	ParallelDriver &operator=(const ParallelDriver &) = delete;

	/* virtual methods from class Driver */
	void CopySingle(const std::filesystem::path &source,
			const std::filesystem::path &destination,
			StatusSender status) override;
	void CopyAll(std::span<const std::filesystem::path> sources,
		     const std::filesystem::path &destination,
		     StatusSender status) override;
	void Wait() noexcept override;

private:
	bool IsAborted() const noexcept {
		return config.error_policy == ErrorPolicy::ABORT &&
			failed.load(std::memory_order_relaxed);
	}

	/**
	 * Mark this driver as failed and report the error to the
	 * control loop.
	 *
	 * Throws if the error could not be queued (std::bad_alloc).
	 */
	void Fail(StatusSender &status, std::exception_ptr error);

	void Start(std::vector<CopyJob> &&_jobs, StatusSender status);

	/**
	 * The worker thread function.
	 */
	void Run(StatusSender status) noexcept;

	/**
	 * Called by the last worker.
	 */
	void Finish() noexcept;
};

} // namespace XCopy
