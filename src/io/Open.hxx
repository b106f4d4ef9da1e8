// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

class UniqueFileDescriptor;

/**
 * Open a file read-only.
 *
 * Throws on error.
 */
UniqueFileDescriptor
OpenReadOnly(const char *path);
