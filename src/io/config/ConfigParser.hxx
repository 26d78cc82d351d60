// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Give this parser a chance to consume the line before
	 * ParseLine() is called.
	 *
	 * @return true if the line has been consumed
	 */
	virtual bool PreParseLine(LineParser &line);

	virtual void ParseLine(LineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * Feed each line of the given file to the #ConfigParser and call
 * ConfigParser::Finish() at the end.
 *
 * Errors are nested inside an exception which names the file and the
 * line number.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
