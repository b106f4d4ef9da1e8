// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "RuntimeError.hxx"
#include "SystemError.hxx"

#include <fmt/format.h>

std::runtime_error
VFmtRuntimeError(fmt::string_view format_str, fmt::format_args args) noexcept
{
	return std::runtime_error{fmt::vformat(format_str, args)};
}

std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept
{
	return MakeErrno(code, fmt::vformat(format_str, args).c_str());
}
