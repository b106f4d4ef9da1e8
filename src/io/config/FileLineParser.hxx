// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "LineParser.hxx"

#include <filesystem>

/**
 * A #LineParser for a line of a configuration file.  It knows the
 * directory containing that file, which is where relative paths are
 * looked up.
 */
class FileLineParser : public LineParser {
	/**
	 * The directory containing the configuration file; empty
	 * means relative paths are used as-is.
	 */
	const std::filesystem::path &directory;

public:
	FileLineParser(const std::filesystem::path &_directory, char *_p) noexcept
		:LineParser(_p), directory(_directory) {}

	/**
	 * Expect a (quoted) path naming a file, i.e. not ending with
	 * a slash.  The result is normalized lexically.
	 */
	std::filesystem::path ExpectFilePath();
};
