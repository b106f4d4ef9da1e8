// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "StringFile.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <array>

std::string
LoadStringFile(const char *path, std::size_t max_size)
{
	const auto fd = OpenReadOnly(path);

	std::string result;
	std::array<std::byte, 4096> buffer;

	while (true) {
		const auto nbytes = fd.Read(buffer);
		if (nbytes < 0)
			throw FmtErrno("Failed to read {}", path);

		if (nbytes == 0)
			break;

		if (result.size() + std::size_t(nbytes) > max_size)
			throw FmtRuntimeError("File is too large: {}", path);

		result.append(reinterpret_cast<const char *>(buffer.data()),
			      nbytes);
	}

	return result;
}
