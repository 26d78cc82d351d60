// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Expand.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/ScopeExit.hxx"

#include <new>

#include <glob.h>

namespace XCopy {

std::vector<std::filesystem::path>
ExpandSources(std::span<const char *const> patterns)
{
	std::vector<std::filesystem::path> result;

	for (const char *pattern : patterns) {
		glob_t g{};
		AtScopeExit(&g) { globfree(&g); };

		switch (glob(pattern, GLOB_NOCHECK|GLOB_TILDE, nullptr, &g)) {
		case 0:
			break;

		case GLOB_NOSPACE:
			throw std::bad_alloc{};

		default:
			throw FmtRuntimeError("Failed to expand {:?}", pattern);
		}

		for (std::size_t i = 0; i < g.gl_pathc; ++i)
			result.emplace_back(g.gl_pathv[i]);
	}

	return result;
}

} // namespace XCopy
