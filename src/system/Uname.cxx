// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Uname.hxx"
#include "Error.hxx"

#include <sys/utsname.h>

std::string
GetKernelMachine()
{
	struct utsname u;
	if (uname(&u) < 0)
		throw MakeErrno("uname() failed");

	return u.machine;
}
