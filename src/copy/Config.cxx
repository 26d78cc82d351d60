// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"

#include <stdexcept>
#include <thread>

#include <string.h>

namespace XCopy {

unsigned
CopyConfig::GetWorkerCount() const noexcept
{
	if (parallelism > 0)
		return parallelism;

	/* hardware_concurrency() may return 0 if unknown */
	const unsigned n = std::thread::hardware_concurrency();
	return n > 0 ? n : 1;
}

const char *
ToString(DriverKind kind) noexcept
{
	switch (kind) {
	case DriverKind::SEQUENTIAL:
		return "sequential";

	case DriverKind::PARALLEL:
		return "parallel";
	}

	return "?";
}

DriverKind
ParseDriverKind(const char *s)
{
	if (strcmp(s, "sequential") == 0)
		return DriverKind::SEQUENTIAL;
	else if (strcmp(s, "parallel") == 0)
		return DriverKind::PARALLEL;
	else
		throw std::invalid_argument("Unknown driver; \"parallel\" or \"sequential\" expected");
}

ErrorPolicy
ParseErrorPolicy(const char *s)
{
	if (strcmp(s, "abort") == 0)
		return ErrorPolicy::ABORT;
	else if (strcmp(s, "continue") == 0)
		return ErrorPolicy::CONTINUE;
	else
		throw std::invalid_argument("\"abort\" or \"continue\" expected");
}

PartialFilePolicy
ParsePartialFilePolicy(const char *s)
{
	if (strcmp(s, "keep") == 0)
		return PartialFilePolicy::KEEP;
	else if (strcmp(s, "remove") == 0)
		return PartialFilePolicy::REMOVE;
	else
		throw std::invalid_argument("\"keep\" or \"remove\" expected");
}

} // namespace XCopy
