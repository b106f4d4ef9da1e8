// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Arch.hxx"

#include <span>

/**
 * A set of #Arch values, stored as a bit mask.  #Arch::NONE is never
 * a member.
 */
class ArchSet {
	uint_least8_t mask = 0;

	static_assert(N_ARCH <= 8);

	static constexpr uint_least8_t Bit(Arch arch) noexcept {
		return arch == Arch::NONE
			? 0
			: uint_least8_t(1U << static_cast<unsigned>(arch));
	}

public:
	constexpr ArchSet() noexcept = default;

	constexpr ArchSet(std::span<const Arch> src) noexcept {
		for (const Arch i : src)
			Add(i);
	}

	constexpr bool empty() const noexcept {
		return mask == 0;
	}

	constexpr void clear() noexcept {
		mask = 0;
	}

	constexpr void Add(Arch arch) noexcept {
		mask |= Bit(arch);
	}

	constexpr bool Contains(Arch arch) const noexcept {
		return arch != Arch::NONE && (mask & Bit(arch)) != 0;
	}

	/**
	 * Do the two sets share at least one element?
	 */
	constexpr bool Intersects(ArchSet other) const noexcept {
		return (mask & other.mask) != 0;
	}

	constexpr bool operator==(const ArchSet &) const noexcept = default;
};
