// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "system/Error.hxx" // IWYU pragma: export

#include <fmt/core.h>

[[nodiscard]] [[gnu::pure]]
std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	return VFmtErrno(errno, format_str, fmt::make_format_args(args...));
}
