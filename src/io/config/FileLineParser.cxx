// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FileLineParser.hxx"

std::filesystem::path
FileLineParser::ExpectFilePath()
{
	const char *value = NextUnescape();
	if (value == nullptr || *value == 0)
		throw Error("Path expected");

	std::filesystem::path path{value};
	if (!path.has_filename())
		throw Error("File name expected");

	if (path.is_relative() && !directory.empty())
		path = directory / path;

	return path.lexically_normal();
}
