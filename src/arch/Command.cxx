// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Command.hxx"
#include "Config.hxx"
#include "Resolver.hxx"
#include "system/Uname.hxx"
#include "io/Logger.hxx"

#include <fmt/format.h>

#include <iterator>

#include <stdlib.h>

using std::string_view_literals::operator""sv;

static const LLogger logger{"ResolveArch"};

const char *const resolve_arch_usage =
	"Usage: ResolveArch [OPTIONS] COMMAND [ARCH...]\n"
	"\n"
	"Options:\n"
	"  -c FILE        load this configuration file\n"
	"  -t FILE        load the compatibility table from this file\n"
	"  -m MACHINE     the machine type\n"
	"  --cpu STRING   pretend the CPU is STRING (see uname -m)\n"
	"  -v             be more verbose (repeatable)\n"
	"\n"
	"Commands:\n"
	"  native         the architecture of the CPU\n"
	"  default        the preferred architecture\n"
	"  supported      all supported architectures in order of preference\n"
	"  supervisor     the architecture of this program\n"
	"  is-supported ARCH...\n"
	"                 exit with status 0 if at least one is supported\n"
	"  match ARCH...  the best supported architecture\n";

CommandLine
ParseCommandLine(int argc, const char *const*argv)
{
	CommandLine cmdline;

	int i = 1;
	const auto NextValue = [&](std::string_view option){
		if (i + 1 >= argc)
			throw UsageError{fmt::format("{} requires a value"sv, option)};
		return argv[++i];
	};

	for (; i < argc && argv[i][0] == '-'; ++i) {
		const std::string_view arg = argv[i];

		if (arg == "-v"sv)
			++cmdline.verbose;
		else if (arg == "-c"sv)
			cmdline.config_path = NextValue(arg);
		else if (arg == "-t"sv)
			cmdline.table_path = NextValue(arg);
		else if (arg == "-m"sv)
			cmdline.machine = NextValue(arg);
		else if (arg == "--cpu"sv)
			cmdline.cpu = NextValue(arg);
		else
			throw UsageError{fmt::format("Unknown option: {}"sv, arg)};
	}

	if (i >= argc)
		throw UsageError{"Command expected"};

	cmdline.command = argv[i++];
	cmdline.args = {argv + i, argv + argc};

	if ((cmdline.command == "is-supported"sv ||
	     cmdline.command == "match"sv) && cmdline.args.empty())
		throw UsageError{fmt::format("{} requires at least one architecture"sv,
					     cmdline.command)};

	return cmdline;
}

std::vector<Arch>
ParseArchList(std::span<const char *const> args)
{
	std::vector<Arch> result;
	result.reserve(args.size());

	for (const char *i : args) {
		const Arch arch = ParseArch(i);
		if (arch == Arch::NONE)
			logger(2, "Unknown architecture: ", i);
		result.push_back(arch);
	}

	return result;
}

static void
AppendArch(std::string &output, Arch arch)
{
	fmt::format_to(std::back_inserter(output), "{}\n"sv, ToString(arch));
}

static ArchConfig
MakeConfig(const CommandLine &cmdline)
{
	ArchConfig config;
	if (cmdline.config_path != nullptr)
		LoadConfigFile(config, cmdline.config_path);
	else
		LoadConfigFile(config, ARCHCOMPAT_CONFIG_FILE, true);

	config.ApplyEnvironment();

	if (cmdline.table_path != nullptr)
		config.table_path = cmdline.table_path;

	if (cmdline.machine != nullptr)
		config.machine = cmdline.machine;

	return config;
}

int
RunCommand(const CommandLine &cmdline, const SupervisorInfo &supervisor,
	   std::string &output)
{
	SetLogLevel(cmdline.verbose);

	ArchResolver resolver(MakeConfig(cmdline),
			      cmdline.cpu != nullptr ? std::string{cmdline.cpu} : GetKernelMachine(),
			      supervisor);

	if (cmdline.command == "native"sv) {
		AppendArch(output, resolver.DetectCpu());
		return EXIT_SUCCESS;
	} else if (cmdline.command == "supervisor"sv) {
		AppendArch(output, resolver.GetSupervisor());
		return EXIT_SUCCESS;
	} else if (cmdline.command != "default"sv &&
		   cmdline.command != "supported"sv &&
		   cmdline.command != "is-supported"sv &&
		   cmdline.command != "match"sv)
		throw UsageError{fmt::format("Unknown command: {}"sv, cmdline.command)};

	if (!resolver.Load())
		throw std::runtime_error{"Failed to load the compatibility table"};

	if (cmdline.command == "default"sv) {
		AppendArch(output, resolver.GetDefault());
		return EXIT_SUCCESS;
	} else if (cmdline.command == "supported"sv) {
		for (const Arch i : resolver.GetSupported())
			AppendArch(output, i);
		return EXIT_SUCCESS;
	} else if (cmdline.command == "is-supported"sv) {
		const auto archs = ParseArchList(cmdline.args);
		return resolver.IsSupported(archs)
			? EXIT_SUCCESS
			: EXIT_FAILURE;
	} else {
		const auto archs = ParseArchList(cmdline.args);
		AppendArch(output, resolver.Match(archs));
		return EXIT_SUCCESS;
	}
}
