// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Config.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/FileLineParser.hxx"
#include "system/Error.hxx"

#include <string_view>

#include <stdlib.h>

using std::string_view_literals::operator""sv;

void
ArchConfig::ApplyEnvironment() noexcept
{
	if (const char *value = getenv("SUPERVISOR_MACHINE");
	    value != nullptr && *value != 0)
		machine = value;
}

class ArchConfigParser final : public ConfigParser {
	ArchConfig &config;

public:
	explicit ArchConfigParser(ArchConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
};

void
ArchConfigParser::ParseLine(FileLineParser &line)
{
	const std::string_view word = line.ExpectWord();

	if (word == "table"sv) {
		config.table_path = line.ExpectFilePath();
		line.ExpectEnd();
	} else if (word == "machine"sv) {
		config.machine = line.ExpectValueAndEnd();
	} else
		throw LineParser::Error{"Unknown option"};
}

void
LoadConfigFile(ArchConfig &config, const std::filesystem::path &path,
	       bool optional)
{
	ArchConfigParser parser(config);
	CommentConfigParser parser2(parser);

	try {
		ParseConfigFile(path, parser2);
	} catch (const std::system_error &e) {
		if (optional && IsFileNotFound(e))
			return;

		throw;
	}
}
