// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include <sys/types.h>

/**
 * An OO wrapper for a UNIX file descriptor which is closed
 * automatically by the destructor.
 */
class UniqueFileDescriptor {
	int fd = -1;

public:
	UniqueFileDescriptor() noexcept = default;

	explicit UniqueFileDescriptor(int _fd) noexcept
		:fd(_fd) {}

	UniqueFileDescriptor(UniqueFileDescriptor &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFileDescriptor() noexcept {
		Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	void Close() noexcept;

	/**
	 * Open the file read-only.  Returns false on error (with
	 * errno set).
	 */
	bool OpenReadOnly(const char *pathname) noexcept;

	ssize_t Read(std::span<std::byte> dest) const noexcept;
};
