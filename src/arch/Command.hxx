// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "system/Arch.hxx"

#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class SupervisorInfo;

/**
 * The command line was malformed.  The caller should print the
 * message followed by the usage text.
 */
class UsageError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

extern const char *const resolve_arch_usage;

struct CommandLine {
	const char *config_path = nullptr;
	const char *table_path = nullptr;
	const char *machine = nullptr;

	/**
	 * Overrides the CPU identifier from uname(2).
	 */
	const char *cpu = nullptr;

	unsigned verbose = 1;

	std::string_view command;
	std::span<const char *const> args;
};

/**
 * Throws #UsageError on error.
 */
CommandLine
ParseCommandLine(int argc, const char *const*argv);

/**
 * Parse architecture names.  Unknown names are converted to
 * #Arch::NONE (with a warning), which is never supported.
 */
std::vector<Arch>
ParseArchList(std::span<const char *const> args);

/**
 * Execute the command.  Lines to be printed on stdout are appended
 * to #output.
 *
 * Throws on error, e.g. #ArchNotFoundError from "match".
 *
 * @return the exit status
 */
int
RunCommand(const CommandLine &cmdline, const SupervisorInfo &supervisor,
	   std::string &output);
