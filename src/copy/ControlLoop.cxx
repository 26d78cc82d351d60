// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ControlLoop.hxx"
#include "Error.hxx"
#include "io/Logger.hxx"

#include <fmt/format.h>

namespace XCopy {

static const LLogger logger{"control"};

TransferTotals
RunControlLoop(StatusReceiver &receiver, ProgressListener &progress,
	       ErrorPolicy policy)
{
	TransferTotals totals;
	std::exception_ptr first_error;
	unsigned n_errors = 0;

	while (auto update = receiver.Receive()) {
		if (const auto *size = std::get_if<SizeUpdate>(&*update)) {
			totals.size += size->bytes;
			progress.IncrementTotal(size->bytes);
		} else if (const auto *copied = std::get_if<CopiedUpdate>(&*update)) {
			totals.copied += copied->bytes;
			if (totals.copied > totals.size)
				throw Error(ErrorKind::CHANNEL,
					    fmt::format("Copied {} bytes, but only {} were announced",
							totals.copied, totals.size));

			progress.Increment(copied->bytes);
		} else {
			auto &error = std::get<ErrorUpdate>(*update).error;

			if (policy == ErrorPolicy::ABORT)
				std::rethrow_exception(error);

			logger(1, "", error);

			if (!first_error)
				first_error = std::move(error);
			++n_errors;
		}
	}

	if (n_errors > 0) {
		try {
			std::rethrow_exception(first_error);
		} catch (...) {
			std::throw_with_nested(Error(ErrorKind::PARTIAL_FAILURE,
						     fmt::format("{} operation(s) failed",
								 n_errors)));
		}
	}

	progress.Finish();
	return totals;
}

} // namespace XCopy
