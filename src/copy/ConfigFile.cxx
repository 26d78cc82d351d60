// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigFile.hxx"
#include "Config.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/LineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace XCopy {

class CopyConfigParser final : public ConfigParser {
	CopyConfig &config;

public:
	explicit CopyConfigParser(CopyConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
};

void
CopyConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "driver") == 0) {
		config.driver_kind = ParseDriverKind(line.ExpectValueAndEnd());
	} else if (strcmp(word, "workers") == 0) {
		config.parallelism = line.ExpectPositiveIntegerAndEnd(CopyConfig::MAX_WORKERS);
	} else if (strcmp(word, "block_size") == 0) {
		config.block_size = line.ExpectSizeAndEnd();
	} else if (strcmp(word, "preserve") == 0) {
		config.preserve_metadata = line.ExpectBoolAndEnd();
	} else if (strcmp(word, "no_clobber") == 0) {
		config.no_clobber = line.ExpectBoolAndEnd();
	} else if (strcmp(word, "dereference") == 0) {
		config.dereference = line.ExpectBoolAndEnd();
	} else if (strcmp(word, "on_error") == 0) {
		config.error_policy = ParseErrorPolicy(line.ExpectValueAndEnd());
	} else if (strcmp(word, "partial_files") == 0) {
		config.partial_file_policy = ParsePartialFilePolicy(line.ExpectValueAndEnd());
	} else
		throw FmtRuntimeError("Unknown option: {:?}", word);
}

void
LoadConfigFile(CopyConfig &config, const fs::path &path)
{
	CopyConfigParser parser{config};
	CommentConfigParser comment_parser{parser};
	ParseConfigFile(path, comment_parser);
}

fs::path
GetDefaultConfigPath()
{
	if (const char *xdg = getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != 0)
		return fs::path{xdg} / "xcopy.conf";

	if (const char *home = getenv("HOME"); home != nullptr && *home != 0)
		return fs::path{home} / ".config" / "xcopy.conf";

	return {};
}

void
LoadOptionalConfigFile(CopyConfig &config, const fs::path &path)
{
	if (path.empty())
		return;

	struct stat st;
	if (stat(path.c_str(), &st) < 0 && (errno == ENOENT || errno == ENOTDIR))
		return;

	LoadConfigFile(config, path);
}

} // namespace XCopy
