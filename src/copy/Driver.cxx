// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Driver.hxx"
#include "Config.hxx"
#include "SequentialDriver.hxx"
#include "ParallelDriver.hxx"
#include "io/Logger.hxx"

namespace XCopy {

static const LLogger logger{"driver"};

std::unique_ptr<Driver>
MakeDriver(const CopyConfig &config)
{
	switch (config.driver_kind) {
	case DriverKind::SEQUENTIAL:
		break;

	case DriverKind::PARALLEL:
		if (config.GetWorkerCount() > 1) {
			logger.Fmt(3, "Using parallel driver with {} workers",
				   config.GetWorkerCount());
			return std::make_unique<ParallelDriver>(config);
		}

		/* a pool with only one worker gains nothing */
		break;
	}

	logger(3, "Using sequential driver");
	return std::make_unique<SequentialDriver>(config);
}

} // namespace XCopy
