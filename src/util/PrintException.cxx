// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "PrintException.hxx"
#include "Exception.hxx"

#include <stdio.h>

void
PrintException(const std::exception &e) noexcept
{
	fprintf(stderr, "%s\n", GetFullMessage(e).c_str());
}

void
PrintException(const std::exception_ptr &ep) noexcept
{
	fprintf(stderr, "%s\n", GetFullMessage(ep).c_str());
}
