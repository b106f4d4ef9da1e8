// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Arch.hxx"

#include <string_view>

/**
 * Look up a raw CPU identifier (e.g. from uname(2)) in the table of
 * well-known CPU families.  The comparison is exact and
 * case-sensitive; callers are expected to pass a lower-case string.
 *
 * @return the #Arch or #Arch::NONE if the identifier is not in the
 * table
 */
[[gnu::pure]]
Arch
LookupCpuFamily(std::string_view cpu) noexcept;

/**
 * Determine the #Arch which can be executed natively by a CPU with
 * the given raw identifier (case-insensitive).  Identifiers which
 * are not in the CPU family table are classified by substrings
 * ("aarch64", "arm" combined with "v8" or "v7").  Unknown CPUs
 * are reported as #Arch::AMD64 (with a warning being logged).
 *
 * This function never returns #Arch::NONE.
 */
Arch
DetectArch(std::string_view cpu) noexcept;
