// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Arch.hxx"

/**
 * The #Arch this program was compiled for.  This may differ from the
 * architecture of the host CPU, e.g. a 32 bit ARM build running on a
 * 64 bit kernel.
 */
#if defined(__x86_64__) || defined(__amd64__)
inline constexpr Arch BUILD_ARCH = Arch::AMD64;
#elif defined(__i386__)
inline constexpr Arch BUILD_ARCH = Arch::I386;
#elif defined(__aarch64__)
inline constexpr Arch BUILD_ARCH = Arch::AARCH64;
#elif defined(__arm__) && (defined(__ARM_ARCH_7__) || defined(__ARM_ARCH_7A__))
inline constexpr Arch BUILD_ARCH = Arch::ARMV7;
#elif defined(__arm__)
inline constexpr Arch BUILD_ARCH = Arch::ARMHF;
#else
inline constexpr Arch BUILD_ARCH = Arch::NONE;
#endif
