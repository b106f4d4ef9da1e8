// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Resolver.hxx"
#include "CompatibilityTable.hxx"
#include "Error.hxx"
#include "system/DetectArch.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

ArchResolver::ArchResolver(const ArchConfig &_config, std::string_view _cpu,
			   const SupervisorInfo &_supervisor)
	:config(_config), cpu(_cpu), supervisor(_supervisor) {}

bool
ArchResolver::Load()
{
	Clear();

	CompatibilityTable table;

	try {
		table = LoadCompatibilityTable(config.table_path.c_str());
	} catch (const ConfigFileError &) {
		logger(2, "Can't read arch json file: ", std::current_exception());
		return false;
	}

	Setup(table);
	return true;
}

void
ArchResolver::Setup(const CompatibilityTable &table)
{
	Clear();

	const Arch native = DetectCpu();
	logger(4, "Native architecture support: ", native);

	if (config.machine.empty()) {
		logger(2, "Can't detect the machine type!");
		default_arch = native;
		SetSupported({native});
		return;
	}

	/* 64 bit ARM hosts can run 32 bit ARM binaries; this
	   overrides the table */
	if (native == Arch::AARCH64 || config.machine == "aarch64"sv) {
		logger(4, "Setting up aarch64 architecture support");
		default_arch = Arch::AARCH64;
		SetSupported({Arch::AARCH64, Arch::ARMV7, Arch::ARMHF});
		return;
	}

	std::vector<Arch> list;

	if (const auto *archs = table.Find(config.machine);
	    archs == nullptr) {
		logger.Fmt(2, "Machine type \"{}\" not found in arch data!",
			   config.machine);
		list.push_back(native);
	} else if (archs->empty()) {
		logger.Fmt(2, "Empty architecture list for machine type \"{}\"",
			   config.machine);
		list.push_back(native);
	} else
		list = *archs;

	default_arch = list.front();

	/* the native architecture is always supported, but has the
	   lowest priority unless the table says otherwise */
	if (std::find(list.begin(), list.end(), native) == list.end())
		list.push_back(native);

	SetSupported(std::move(list));
}

Arch
ArchResolver::Match(std::span<const Arch> archs) const
{
	for (const Arch i : supported)
		if (std::find(archs.begin(), archs.end(), i) != archs.end())
			return i;

	throw ArchNotFoundError{};
}

Arch
ArchResolver::DetectCpu() const noexcept
{
	return DetectArch(cpu);
}
