// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <array>
#include <exception>

#include <string.h>

namespace fs = std::filesystem;

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	/* configuration files are small; read the whole file into a
	   stack buffer, leaving room for the null terminator */
	std::array<char, 16384> buffer;

	const auto fd = OpenReadOnly(path.c_str());
	const auto nbytes = fd.ReadAt(0, buffer.data(), buffer.size());
	if (nbytes < 0)
		throw FmtErrno("Failed to read {:?}", path.c_str());

	if ((std::size_t)nbytes >= buffer.size())
		throw FmtRuntimeError("File {:?} is too large", path.c_str());

	buffer[nbytes] = 0;

	unsigned i = 1;
	for (char *line = buffer.data(); line != nullptr; ++i) {
		char *newline = strchr(line, '\n');
		if (newline != nullptr)
			*newline++ = 0;

		LineParser line_parser(line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(FmtRuntimeError("{}:{}",
							       path.native(), i));
		}

		line = newline;
	}

	parser.Finish();
}
