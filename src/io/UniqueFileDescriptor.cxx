// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "UniqueFileDescriptor.hxx"

#include <fcntl.h>
#include <unistd.h>

void
UniqueFileDescriptor::Close() noexcept
{
	if (IsDefined())
		close(std::exchange(fd, -1));
}

bool
UniqueFileDescriptor::OpenReadOnly(const char *pathname) noexcept
{
	Close();
	fd = open(pathname, O_RDONLY|O_NOCTTY|O_CLOEXEC);
	return IsDefined();
}

ssize_t
UniqueFileDescriptor::Read(std::span<std::byte> dest) const noexcept
{
	return read(fd, dest.data(), dest.size());
}
