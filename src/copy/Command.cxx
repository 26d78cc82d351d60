// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Command.hxx"
#include "Config.hxx"
#include "Driver.hxx"
#include "Error.hxx"
#include "io/FileAt.hxx"
#include "io/Logger.hxx"
#include "io/SameFile.hxx"
#include "lib/fmt/SystemError.hxx"

namespace fs = std::filesystem;

namespace XCopy {

static const LLogger logger{"xcopy"};

/**
 * Like std::filesystem::status(), but a missing destination is not an
 * error: it yields a status of type "not_found".
 *
 * Throws std::system_error if the destination cannot be inspected.
 */
static fs::file_status
StatDestination(const fs::path &destination)
{
	std::error_code ec;
	auto status = fs::status(destination, ec);
	if (ec && ec != std::errc::no_such_file_or_directory &&
	    ec != std::errc::not_a_directory)
		throw FmtErrno(ec.value(), "Failed to stat {:?}",
			       destination.c_str());

	return status;
}

/**
 * Sanity-check all sources of a multi-source (or directory) copy
 * before anything gets modified.
 */
static void
CheckSources(const CopyConfig &config, std::span<const fs::path> sources,
	     const fs::path &destination, fs::file_status destination_status)
{
	const bool destination_exists = fs::exists(destination_status);
	const bool destination_is_directory = fs::is_directory(destination_status);

	for (const auto &source : sources) {
		logger.Fmt(2, "Copying source {:?} to {:?}",
			   source.c_str(), destination.c_str());

		/* a source which cannot be inspected counts as missing */
		std::error_code ec;
		if (!fs::exists(fs::symlink_status(source, ec)))
			throw Error(ErrorKind::INVALID_SOURCE,
				    "Source does not exist.");

		if (fs::is_directory(source, ec) && !config.recursive)
			throw Error(ErrorKind::INVALID_SOURCE,
				    "Source is directory and --recursive not specified.");

		if (source == destination)
			throw Error(ErrorKind::INVALID_SOURCE,
				    "Cannot copy a directory into itself");

		if (destination_exists && !destination_is_directory)
			throw Error(ErrorKind::INVALID_DESTINATION,
				    "Source is directory but target exists and is not a directory");
	}
}

TransferTotals
RunCopy(const CopyConfig &config, std::span<const fs::path> sources,
	const fs::path &destination, ProgressListener &progress)
{
	const auto destination_status = StatDestination(destination);

	if (sources.size() > 1 && !fs::is_directory(destination_status))
		throw Error(ErrorKind::INVALID_DESTINATION,
			    "Multiple sources and destination is not a directory.");

	if (sources.empty())
		throw Error(ErrorKind::INVALID_SOURCE,
			    "No source files found.");

	auto driver = MakeDriver(config);
	auto [sender, receiver] = MakeStatusChannel();

	if (sources.size() == 1 && fs::is_regular_file(destination_status)) {
		/* overwriting an existing file */
		const auto &source = sources.front();

		if (fs::is_directory(source)) {
			if (!config.recursive)
				throw Error(ErrorKind::INVALID_SOURCE,
					    "Source is directory and --recursive not specified.");

			throw Error(ErrorKind::INVALID_DESTINATION,
				    "Source is directory but target exists and is not a directory");
		}

		if (config.no_clobber)
			throw Error(ErrorKind::DESTINATION_EXISTS,
				    "Destination file exists and --no-clobber is set.");

		if (IsSameFile(FileAt::CurrentDirectory(source.c_str()),
			       FileAt::CurrentDirectory(destination.c_str())))
			throw Error(ErrorKind::DESTINATION_EXISTS,
				    "Source and destination is the same file.");

		logger.Fmt(2, "Copying file {:?} to {:?}",
			   source.c_str(), destination.c_str());
		driver->CopySingle(source, destination, std::move(sender));
	} else {
		CheckSources(config, sources, destination, destination_status);
		driver->CopyAll(sources, destination, std::move(sender));
	}

	/* our sender has been moved to the driver, so the channel
	   ends when the driver is done */
	const auto totals = RunControlLoop(receiver, progress,
					   config.error_policy);
	driver->Wait();

	logger(2, "Copy complete");
	return totals;
}

} // namespace XCopy
