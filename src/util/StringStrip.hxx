// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "CharUtil.hxx"

#include <cstddef>

#include <string.h>

/**
 * Skips whitespace at the beginning of the string, and returns the
 * first non-whitespace character.
 */
[[gnu::pure]] [[gnu::returns_nonnull]] [[gnu::nonnull]]
inline char *
StripLeft(char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;
	return p;
}

/**
 * Remove trailing whitespace from the null-terminated string (in
 * place).
 */
[[gnu::nonnull]]
inline void
StripRight(char *p) noexcept
{
	std::size_t length = strlen(p);
	while (length > 0 && IsWhitespaceOrNull(p[length - 1]))
		--length;
	p[length] = 0;
}
