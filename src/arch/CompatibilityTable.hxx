// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "system/Arch.hxx"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * Maps machine types (board or product names) to the list of
 * architectures which can be executed on that machine, in order of
 * preference.
 */
class CompatibilityTable {
	std::map<std::string, std::vector<Arch>, std::less<>> machines;

public:
	bool empty() const noexcept {
		return machines.empty();
	}

	std::size_t size() const noexcept {
		return machines.size();
	}

	void Add(std::string_view machine, std::vector<Arch> &&archs) {
		machines.insert_or_assign(std::string{machine}, std::move(archs));
	}

	/**
	 * @return the architecture list for the given machine type or
	 * nullptr if the machine type is not in the table
	 */
	[[gnu::pure]]
	const std::vector<Arch> *Find(std::string_view machine) const noexcept {
		if (const auto i = machines.find(machine); i != machines.end())
			return &i->second;
		return nullptr;
	}
};

/**
 * Parse a compatibility table from a JSON document of the form
 * <code>{"machine": ["arch1", "arch2"], ...}</code>.
 *
 * Throws #ConfigFileError if the document is malformed or refers to
 * an unknown architecture.
 */
CompatibilityTable
ParseCompatibilityTable(std::string_view json);

/**
 * Load and parse a compatibility table file.
 *
 * Throws #ConfigFileError on error.
 */
CompatibilityTable
LoadCompatibilityTable(const char *path);
