// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>
#include <span>
#include <vector>

namespace XCopy {

/**
 * Expand shell wildcards in the given patterns.  A pattern without
 * matches is passed through literally.
 *
 * Throws on error.
 */
std::vector<std::filesystem::path>
ExpandSources(std::span<const char *const> patterns);

} // namespace XCopy
