// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "thread/Channel.hxx"

#include <cstdint>
#include <exception>
#include <variant>

namespace XCopy {

/**
 * A number of bytes of a file has been copied.
 */
struct CopiedUpdate {
	uint_least64_t bytes;
};

/**
 * A file of the given size is about to be copied.  This is sent
 * exactly once per file, before its first #CopiedUpdate.
 */
struct SizeUpdate {
	uint_least64_t bytes;
};

/**
 * An operation has failed.
 */
struct ErrorUpdate {
	std::exception_ptr error;
};

using StatusUpdate = std::variant<CopiedUpdate, SizeUpdate, ErrorUpdate>;

using StatusSender = ChannelSender<StatusUpdate>;
using StatusReceiver = ChannelReceiver<StatusUpdate>;

inline std::pair<StatusSender, StatusReceiver>
MakeStatusChannel()
{
	return MakeChannel<StatusUpdate>();
}

} // namespace XCopy
