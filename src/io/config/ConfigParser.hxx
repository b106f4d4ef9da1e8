// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <filesystem>

class FileLineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Give this parser a chance to consume the line before
	 * ParseLine() gets called.
	 *
	 * @return true if the line has been consumed
	 */
	virtual bool PreParseLine(FileLineParser &line);

	virtual void ParseLine(FileLineParser &line) = 0;

	/**
	 * The end of the file has been reached.  May throw if the
	 * configuration is incomplete.
	 */
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child)
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) final;
	void Finish() override;
};

/**
 * Parse the given file line by line.  Errors are wrapped in a
 * #LineParser::Error (with the file name and line number) using
 * std::throw_with_nested().
 *
 * Throws on I/O error.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
