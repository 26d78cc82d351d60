// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "copy/Error.hxx"
#include "util/StringParser.hxx"

#include <fmt/core.h>

#include <exception>
#include <stdexcept>
#include <string>

#include <getopt.h>
#include <stdio.h>

namespace XCopy {

enum LongOption {
	OPTION_KEEP_GOING = 0x100,
	OPTION_REMOVE_PARTIAL,
	OPTION_NO_PROGRESS,
};

static constexpr struct option long_options[] = {
	{"recursive", no_argument, nullptr, 'r'},
	{"no-clobber", no_argument, nullptr, 'n'},
	{"verbose", no_argument, nullptr, 'v'},
	{"driver", required_argument, nullptr, 'd'},
	{"workers", required_argument, nullptr, 'w'},
	{"block-size", required_argument, nullptr, 'b'},
	{"preserve", no_argument, nullptr, 'p'},
	{"dereference", no_argument, nullptr, 'L'},
	{"keep-going", no_argument, nullptr, OPTION_KEEP_GOING},
	{"remove-partial", no_argument, nullptr, OPTION_REMOVE_PARTIAL},
	{"no-progress", no_argument, nullptr, OPTION_NO_PROGRESS},
	{"config", required_argument, nullptr, 'c'},
	{"help", no_argument, nullptr, 'h'},
	{nullptr, 0, nullptr, 0},
};

static constexpr char short_options[] = ":rnvd:w:b:pLc:h";

void
CommandLine::ApplyTo(CopyConfig &config) const noexcept
{
	if (driver_kind)
		config.driver_kind = *driver_kind;

	if (parallelism)
		config.parallelism = *parallelism;

	if (block_size)
		config.block_size = *block_size;

	if (recursive)
		config.recursive = true;

	if (no_clobber)
		config.no_clobber = true;

	if (preserve_metadata)
		config.preserve_metadata = true;

	if (dereference)
		config.dereference = true;

	if (keep_going)
		config.error_policy = ErrorPolicy::CONTINUE;

	if (remove_partial)
		config.partial_file_policy = PartialFilePolicy::REMOVE;
}

/**
 * Describe the option getopt_long() has just complained about.
 */
static std::string
GetOptionName(char **argv)
{
	if (optopt != 0)
		/* a short option */
		return fmt::format("-{}", (char)optopt);

	return argv[optind - 1];
}

[[noreturn]]
static void
ThrowInvalidValue(const char *option)
{
	std::throw_with_nested(Error(ErrorKind::INVALID_ARGUMENTS,
				     fmt::format("Invalid value for {}", option)));
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;

	/* reinitialize getopt, so this function can be called more
	   than once */
	optind = 0;
	opterr = 0;

	int opt;
	while ((opt = getopt_long(argc, argv, short_options,
				  long_options, nullptr)) != -1) {
		switch (opt) {
		case 'r':
			cmdline.recursive = true;
			break;

		case 'n':
			cmdline.no_clobber = true;
			break;

		case 'v':
			++cmdline.verbose;
			break;

		case 'd':
			try {
				cmdline.driver_kind = ParseDriverKind(optarg);
			} catch (...) {
				ThrowInvalidValue("--driver");
			}
			break;

		case 'w':
			try {
				cmdline.parallelism = ParsePositiveLong(optarg, CopyConfig::MAX_WORKERS);
			} catch (...) {
				ThrowInvalidValue("--workers");
			}
			break;

		case 'b':
			try {
				const auto value = ParseSize(optarg);
				if (value == 0)
					throw std::invalid_argument("Block size must not be zero");

				cmdline.block_size = value;
			} catch (...) {
				ThrowInvalidValue("--block-size");
			}
			break;

		case 'p':
			cmdline.preserve_metadata = true;
			break;

		case 'L':
			cmdline.dereference = true;
			break;

		case OPTION_KEEP_GOING:
			cmdline.keep_going = true;
			break;

		case OPTION_REMOVE_PARTIAL:
			cmdline.remove_partial = true;
			break;

		case OPTION_NO_PROGRESS:
			cmdline.progress = false;
			break;

		case 'c':
			cmdline.config_path = optarg;
			break;

		case 'h':
			cmdline.help = true;
			break;

		case ':':
			throw Error(ErrorKind::INVALID_ARGUMENTS,
				    fmt::format("Missing argument for {}",
						GetOptionName(argv)));

		default:
			throw Error(ErrorKind::INVALID_ARGUMENTS,
				    fmt::format("Unknown option: {}",
						GetOptionName(argv)));
		}
	}

	if (cmdline.help)
		return cmdline;

	for (int i = optind; i < argc; ++i)
		cmdline.paths.push_back(argv[i]);

	if (cmdline.paths.size() < 2)
		throw Error(ErrorKind::INVALID_ARGUMENTS,
			    "Insufficient arguments");

	return cmdline;
}

void
PrintUsage(const char *program)
{
	fmt::print(stdout,
		   "Usage: {} [OPTIONS] SOURCE... DEST\n"
		   "Copy SOURCE to DEST, or multiple SOURCE(s) to DIRECTORY.\n"
		   "\n"
		   "Options:\n"
		   "  -r, --recursive        copy directories recursively\n"
		   "  -n, --no-clobber       do not overwrite existing files\n"
		   "  -v, --verbose          increase verbosity (repeatable)\n"
		   "  -d, --driver=NAME      \"parallel\" (default) or \"sequential\"\n"
		   "  -w, --workers=N        worker threads (default: CPU count)\n"
		   "  -b, --block-size=N     copy block size in bytes (suffix k/M/G)\n"
		   "  -p, --preserve         preserve mode, ownership and timestamps\n"
		   "  -L, --dereference      follow symlinks in SOURCE\n"
		   "      --keep-going       continue after errors, report at the end\n"
		   "      --remove-partial   delete partially written files on error\n"
		   "      --no-progress      do not show progress\n"
		   "  -c, --config=FILE      read defaults from FILE\n"
		   "  -h, --help             show this help\n",
		   program);
}

} // namespace XCopy
