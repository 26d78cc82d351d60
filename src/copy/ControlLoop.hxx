// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "Status.hxx"

#include <cstdint>

namespace XCopy {

/**
 * Receives the progress of a copy from RunControlLoop().
 */
class ProgressListener {
public:
	/**
	 * The given number of bytes has been copied.
	 */
	virtual void Increment(uint_least64_t bytes) noexcept = 0;

	/**
	 * The total number of bytes to be copied has grown.
	 */
	virtual void IncrementTotal(uint_least64_t bytes) noexcept = 0;

	/**
	 * All operations have completed successfully.
	 */
	virtual void Finish() noexcept = 0;
};

class NullProgressListener final : public ProgressListener {
public:
	void Increment(uint_least64_t) noexcept override {}
	void IncrementTotal(uint_least64_t) noexcept override {}
	void Finish() noexcept override {}
};

struct TransferTotals {
	uint_least64_t size = 0, copied = 0;
};

/**
 * Consume the status channel until all senders have been released,
 * forwarding progress to the #ProgressListener.
 *
 * With ErrorPolicy::ABORT, the first error is rethrown immediately.
 * With ErrorPolicy::CONTINUE, errors are logged, and after the
 * channel has ended an #Error with ErrorKind::PARTIAL_FAILURE is
 * thrown (the first error nested inside it).  Throws
 * ErrorKind::CHANNEL if more bytes were copied than announced.
 *
 * @return the totals of all #SizeUpdate and #CopiedUpdate messages
 */
TransferTotals
RunControlLoop(StatusReceiver &receiver, ProgressListener &progress,
	       ErrorPolicy policy);

} // namespace XCopy
