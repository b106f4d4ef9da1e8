// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

/**
 * An enum which identifies a CPU architecture, as used for tagging
 * artifacts (e.g. container images).
 */
enum class Arch : uint_least8_t {
	/**
	 * Special value for "none", "unspecified", "unknown".
	 */
	NONE,

	/**
	 * 32 bit ARMv7 with hardware floating point.
	 */
	ARMV7,

	/**
	 * 32 bit ARMv6 with hardware floating point, aka "armhf"
	 * (Raspberry Pi 1 and Zero).
	 */
	ARMHF,

	/**
	 * ARM64, aka "aarch64".
	 */
	AARCH64,

	/**
	 * 32 bit x86, aka "i686".
	 */
	I386,

	/**
	 * AMD64, aka "x86-64".
	 */
	AMD64,
};

/**
 * The number of #Arch values (including #NONE).
 */
inline constexpr std::size_t N_ARCH = static_cast<std::size_t>(Arch::AMD64) + 1;

/**
 * Convert the #Arch to a string.
 *
 * Returns an empty string as a special case for #NONE (because there
 * is no string representation of this special value).
 */
constexpr std::string_view
ToString(Arch arch) noexcept
{
	using std::string_view_literals::operator""sv;

	switch (arch) {
	case Arch::NONE:
		break;

	case Arch::ARMV7:
		return "armv7"sv;

	case Arch::ARMHF:
		return "armhf"sv;

	case Arch::AARCH64:
		return "aarch64"sv;

	case Arch::I386:
		return "i386"sv;

	case Arch::AMD64:
		return "amd64"sv;
	}

	return {};
}

/**
 * Parse a string to an #Arch.  Returns #NONE if the string is not
 * recognized.
 */
constexpr Arch
ParseArch(std::string_view s) noexcept
{
	using std::string_view_literals::operator""sv;

	if (s == "armv7"sv)
		return Arch::ARMV7;
	else if (s == "armhf"sv)
		return Arch::ARMHF;
	else if (s == "aarch64"sv)
		return Arch::AARCH64;
	else if (s == "i386"sv)
		return Arch::I386;
	else if (s == "amd64"sv)
		return Arch::AMD64;
	else
		return Arch::NONE;
}
