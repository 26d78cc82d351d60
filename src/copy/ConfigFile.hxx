// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>

namespace XCopy {

struct CopyConfig;

/**
 * Load settings from the given configuration file into #config.
 * Throws on error.
 */
void
LoadConfigFile(CopyConfig &config, const std::filesystem::path &path);

/**
 * Determine the path of the per-user configuration file
 * ($XDG_CONFIG_HOME/xcopy.conf or ~/.config/xcopy.conf).  Returns an
 * empty path if neither variable is set.
 */
std::filesystem::path
GetDefaultConfigPath();

/**
 * Like LoadConfigFile(), but silently ignore a missing file.
 */
void
LoadOptionalConfigFile(CopyConfig &config,
		       const std::filesystem::path &path);

} // namespace XCopy
