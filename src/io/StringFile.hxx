// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <string>

/**
 * Read the whole contents of a (regular) file into a std::string.
 *
 * Throws on I/O error or if the file is larger than #max_size.
 */
std::string
LoadStringFile(const char *path, std::size_t max_size=1024 * 1024);
