// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <exception>
#include <string>
#include <string_view>

/**
 * Obtain the full concatenated message of an exception and its
 * nested chain.
 */
[[gnu::pure]]
std::string
GetFullMessage(std::exception_ptr ep,
	       std::string_view fallback="Unknown exception",
	       std::string_view separator="; ") noexcept;

[[gnu::pure]]
std::string
GetFullMessage(const std::exception &e,
	       std::string_view fallback="Unknown exception",
	       std::string_view separator="; ") noexcept;
