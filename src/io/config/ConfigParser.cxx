// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "FileLineParser.hxx"
#include "io/StringFile.hxx"

#include <fmt/format.h>

#include <exception>
#include <string>

using std::string_view_literals::operator""sv;

bool
ConfigParser::PreParseLine(FileLineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(FileLineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(FileLineParser &line)
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
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	std::string contents = LoadStringFile(path.c_str());
	const auto directory = path.parent_path();

	unsigned i = 1;
	for (std::size_t start = 0; start < contents.size(); ++i) {
		std::size_t end = contents.find('\n', start);
		if (end == contents.npos)
			end = contents.size();
		else
			contents[end] = 0;

		/* the line is null-terminated in place; the last
		   line is terminated by std::string */
		FileLineParser line_parser(directory, contents.data() + start);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(), i)});
		}

		start = end + 1;
	}

	parser.Finish();
}
