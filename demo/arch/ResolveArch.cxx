// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Print information about the architectures supported by this host.
 */

#include "arch/Command.hxx"
#include "arch/Resolver.hxx"
#include "system/BuildArch.hxx"
#include "util/PrintException.hxx"

#include <fmt/core.h>

#include <string>

#include <stdlib.h>

/**
 * The "supervisor" of this tool is the tool itself.
 */
class BuildSupervisorInfo final : public SupervisorInfo {
public:
	Arch GetArch() const noexcept override {
		return BUILD_ARCH;
	}
};

int
main(int argc, char **argv) noexcept
try {
	const BuildSupervisorInfo supervisor{};
	std::string output;
	int status;

	try {
		status = RunCommand(ParseCommandLine(argc, argv), supervisor, output);
	} catch (const UsageError &e) {
		fmt::print(stderr, "{}\n\n{}", e.what(), resolve_arch_usage);
		return EXIT_FAILURE;
	}

	fmt::print("{}", output);
	return status;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
