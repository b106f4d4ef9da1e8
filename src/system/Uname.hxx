// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string>

/**
 * Return the hardware identifier of the running kernel (the
 * "machine" field of uname(2), e.g. "x86_64" or "armv7l").
 *
 * Throws on error.
 */
std::string
GetKernelMachine();
