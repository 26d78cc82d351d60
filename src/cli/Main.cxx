// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Expand.hxx"
#include "ProgressBar.hxx"
#include "copy/Command.hxx"
#include "copy/Config.hxx"
#include "copy/ConfigFile.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <filesystem>
#include <memory>
#include <span>

#include <stdlib.h>
#include <unistd.h>

using namespace XCopy;

static std::unique_ptr<ProgressListener>
MakeProgressListener(bool enabled) noexcept
{
	if (enabled && isatty(STDERR_FILENO))
		return std::make_unique<ProgressBar>(stderr);

	return std::make_unique<NullProgressListener>();
}

int
main(int argc, char **argv)
try {
	const auto cmdline = ParseCommandLine(argc, argv);
	if (cmdline.help) {
		PrintUsage(argv[0]);
		return EXIT_SUCCESS;
	}

	SetLogLevel(1 + cmdline.verbose);

	CopyConfig config;
	if (cmdline.config_path != nullptr)
		LoadConfigFile(config, cmdline.config_path);
	else
		LoadOptionalConfigFile(config, GetDefaultConfigPath());

	cmdline.ApplyTo(config);

	const std::span<const char *const> paths{cmdline.paths};
	const std::filesystem::path destination{paths.back()};
	const auto sources = ExpandSources(paths.first(paths.size() - 1));

	/* no progress bar while log lines are printed */
	const auto progress = MakeProgressListener(cmdline.progress &&
						   cmdline.verbose == 0);

	RunCopy(config, sources, destination, *progress);
	return EXIT_SUCCESS;
} catch (const std::exception &e) {
	PrintException(e);
	return EXIT_FAILURE;
}
