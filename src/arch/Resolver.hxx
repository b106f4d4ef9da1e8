// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Config.hxx"
#include "io/Logger.hxx"
#include "system/Arch.hxx"
#include "system/ArchSet.hxx"

#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class CompatibilityTable;

/**
 * Provides information about the supervisor (the program which
 * manages the artifacts).  Implemented by the caller.
 */
class SupervisorInfo {
public:
	/**
	 * The architecture the supervisor itself runs as.
	 */
	virtual Arch GetArch() const noexcept = 0;

protected:
	~SupervisorInfo() noexcept = default;
};

/**
 * Determines which architectures can be executed on this host, in
 * order of preference.
 *
 * The object is empty after construction; call Load() once before
 * using the query methods.  Load() must not be called concurrently
 * with any other method; after it has returned, the const methods
 * may be used from multiple threads.
 */
class ArchResolver {
	const LLogger logger{"arch"};

	const ArchConfig config;

	/**
	 * The raw CPU identifier, e.g. from uname(2).
	 */
	const std::string cpu;

	const SupervisorInfo &supervisor;

	Arch default_arch = Arch::NONE;

	/**
	 * The supported architectures in order of preference.
	 */
	std::vector<Arch> supported;

	/**
	 * A copy of #supported for fast lookups.
	 */
	ArchSet supported_set;

public:
	/**
	 * @param _cpu the raw CPU identifier (see GetKernelMachine())
	 */
	ArchResolver(const ArchConfig &_config, std::string_view _cpu,
		     const SupervisorInfo &_supervisor);

	ArchResolver(const ArchResolver &) = delete;
	ArchResolver &operator=(const ArchResolver &) = delete;

	/**
	 * Load the compatibility table and determine the supported
	 * architectures.  Errors are logged, but not thrown; if the
	 * table cannot be loaded, the object remains empty.
	 *
	 * @return true on success, false if the compatibility table
	 * could not be loaded
	 */
	bool Load();

	/**
	 * Determine the supported architectures from an already
	 * loaded compatibility table.  This is the second half of
	 * Load().
	 */
	void Setup(const CompatibilityTable &table);

	/**
	 * The preferred architecture.  Returns #Arch::NONE if Load()
	 * has not been called or has failed.
	 */
	Arch GetDefault() const noexcept {
		return default_arch;
	}

	Arch GetSupervisor() const noexcept {
		return supervisor.GetArch();
	}

	std::span<const Arch> GetSupported() const noexcept {
		return supported;
	}

	ArchSet GetSupportedSet() const noexcept {
		return supported_set;
	}

	/**
	 * Is at least one of the given architectures supported by
	 * this host?
	 */
	[[gnu::pure]]
	bool IsSupported(std::span<const Arch> archs) const noexcept {
		return supported_set.Intersects(ArchSet{archs});
	}

	/**
	 * Choose the best of the given architectures for this host.
	 * The host's order of preference decides, not the order of
	 * the parameter.
	 *
	 * Throws #ArchNotFoundError if none of them is supported.
	 */
	Arch Match(std::span<const Arch> archs) const;

	/**
	 * Determine the architecture which can be executed natively
	 * by this host's CPU.
	 */
	Arch DetectCpu() const noexcept;

private:
	void Clear() noexcept {
		default_arch = Arch::NONE;
		supported.clear();
		supported_set.clear();
	}

	void SetSupported(std::vector<Arch> &&_supported) noexcept {
		supported = std::move(_supported);
		supported_set = ArchSet{supported};
	}
};
