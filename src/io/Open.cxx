// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

UniqueFileDescriptor
OpenReadOnly(const char *path)
{
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path))
		throw FmtErrno("Failed to open {}", path);

	return fd;
}
