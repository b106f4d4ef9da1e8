// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <filesystem>
#include <string>

#ifndef ARCHCOMPAT_DATA_DIR
#define ARCHCOMPAT_DATA_DIR "/usr/share/archcompat"
#endif

#ifndef ARCHCOMPAT_CONFIG_FILE
#define ARCHCOMPAT_CONFIG_FILE "/etc/archcompat/archcompat.conf"
#endif

struct ArchConfig {
	/**
	 * The JSON file containing the #CompatibilityTable.
	 */
	std::filesystem::path table_path = ARCHCOMPAT_DATA_DIR "/arch.json";

	/**
	 * The machine type (board or product name).  An empty string
	 * means the machine type is unknown.
	 */
	std::string machine;

	/**
	 * Apply settings from environment variables (currently only
	 * "SUPERVISOR_MACHINE").
	 */
	void ApplyEnvironment() noexcept;
};

/**
 * Load the specified configuration file into the #ArchConfig.
 *
 * Throws on error.
 *
 * @param optional if true, then a missing file is not an error
 */
void
LoadConfigFile(ArchConfig &config, const std::filesystem::path &path,
	       bool optional=false);
