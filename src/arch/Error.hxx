// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <stdexcept>

/**
 * The compatibility table file could not be read or parsed.  The
 * cause (a std::system_error or a JSON parser error) is usually
 * attached as nested exception.
 */
class ConfigFileError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * None of the requested architectures is supported by this host.
 */
class ArchNotFoundError : public std::runtime_error {
public:
	ArchNotFoundError()
		:std::runtime_error("No supported architecture") {}
};
