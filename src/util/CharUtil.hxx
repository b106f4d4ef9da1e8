// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

constexpr bool
IsWhitespaceOrNull(const char ch) noexcept
{
	return (unsigned char)ch <= 0x20;
}

constexpr bool
IsWhitespaceNotNull(const char ch) noexcept
{
	return ch > 0 && ch <= 0x20;
}

constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

constexpr bool
IsLowerAlphaASCII(char ch) noexcept
{
	return ch >= 'a' && ch <= 'z';
}

constexpr bool
IsUpperAlphaASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z';
}

constexpr bool
IsAlphaNumericASCII(char ch) noexcept
{
	return IsLowerAlphaASCII(ch) || IsUpperAlphaASCII(ch) ||
		IsDigitASCII(ch);
}

constexpr char
ToLowerASCII(char ch) noexcept
{
	return IsUpperAlphaASCII(ch)
		? char(ch - 'A' + 'a')
		: ch;
}
