// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CompatibilityTable.hxx"
#include "Error.hxx"
#include "io/StringFile.hxx"

#include <nlohmann/json.hpp>

#include <fmt/format.h>

#include <exception>

using std::string_view_literals::operator""sv;

static std::vector<Arch>
ParseArchList(std::string_view machine, const nlohmann::json &j)
{
	if (!j.is_array())
		throw ConfigFileError{fmt::format("Architecture list for machine '{}' is not an array"sv,
						  machine)};

	std::vector<Arch> result;
	result.reserve(j.size());

	for (const auto &i : j) {
		if (!i.is_string())
			throw ConfigFileError{fmt::format("Architecture list for machine '{}' contains a non-string"sv,
							  machine)};

		const std::string_view name = i.get_ref<const std::string &>();
		const Arch arch = ParseArch(name);
		if (arch == Arch::NONE)
			throw ConfigFileError{fmt::format("Unknown architecture '{}' for machine '{}'"sv,
							  name, machine)};

		result.push_back(arch);
	}

	return result;
}

CompatibilityTable
ParseCompatibilityTable(std::string_view src)
{
	nlohmann::json j;

	try {
		j = nlohmann::json::parse(src);
	} catch (const nlohmann::json::exception &) {
		/* not only parse_error: a number overflow is reported
		   as out_of_range */
		std::throw_with_nested(ConfigFileError{"JSON parser error"});
	}

	if (!j.is_object())
		throw ConfigFileError{"Compatibility table is not a JSON object"};

	CompatibilityTable table;

	for (const auto &i : j.items())
		table.Add(i.key(), ParseArchList(i.key(), i.value()));

	return table;
}

CompatibilityTable
LoadCompatibilityTable(const char *path)
{
	std::string contents;

	try {
		contents = LoadStringFile(path);
	} catch (const std::runtime_error &) {
		std::throw_with_nested(ConfigFileError{fmt::format("Failed to read {}"sv, path)});
	}

	try {
		return ParseCompatibilityTable(contents);
	} catch (const ConfigFileError &) {
		std::throw_with_nested(ConfigFileError{fmt::format("Failed to parse {}"sv, path)});
	}
}
