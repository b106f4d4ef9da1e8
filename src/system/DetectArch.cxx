// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "DetectArch.hxx"
#include "io/Logger.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <utility>

using std::string_view_literals::operator""sv;

static const LLogger logger{"arch"};

static constexpr std::array<std::pair<std::string_view, Arch>, 6> cpu_families{{
	{"armv7"sv, Arch::ARMV7},
	{"armv6"sv, Arch::ARMHF},
	{"armv8"sv, Arch::AARCH64},
	{"aarch64"sv, Arch::AARCH64},
	{"i686"sv, Arch::I386},
	{"x86_64"sv, Arch::AMD64},
}};

Arch
LookupCpuFamily(std::string_view cpu) noexcept
{
	for (const auto &[name, arch] : cpu_families)
		if (cpu == name)
			return arch;

	return Arch::NONE;
}

static constexpr bool
Contains(std::string_view haystack, std::string_view needle) noexcept
{
	return haystack.find(needle) != haystack.npos;
}

Arch
DetectArch(std::string_view raw_cpu) noexcept
{
	/* utsname::machine is 65 bytes; longer identifiers are
	   truncated */
	std::array<char, 128> buffer;
	const std::size_t length = std::min(raw_cpu.size(), buffer.size());
	std::transform(raw_cpu.begin(), std::next(raw_cpu.begin(), length),
		       buffer.begin(), ToLowerASCII);
	const std::string_view cpu{buffer.data(), length};

	if (const Arch arch = LookupCpuFamily(cpu); arch != Arch::NONE)
		return arch;

	if (Contains(cpu, "aarch64"sv))
		return Arch::AARCH64;

	if (Contains(cpu, "arm"sv)) {
		if (Contains(cpu, "v8"sv))
			return Arch::AARCH64;

		if (Contains(cpu, "v7"sv))
			return Arch::ARMV7;

		return Arch::ARMHF;
	}

	logger(2, "Unsupported CPU architecture: ", cpu);
	return Arch::AMD64;
}
