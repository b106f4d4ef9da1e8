// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "arch/Config.hxx"
#include "io/config/LineParser.hxx"
#include "system/Error.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <stdlib.h>

TEST(ArchConfig, Defaults)
{
	const ArchConfig config;
	EXPECT_EQ(config.table_path.native(), ARCHCOMPAT_DATA_DIR "/arch.json");
	EXPECT_TRUE(config.machine.empty());
}

TEST(ArchConfig, LoadFile)
{
	ArchConfig config;
	LoadConfigFile(config, TEST_DATA_DIR "/archcompat.conf");

	EXPECT_EQ(config.table_path.native(), TEST_DATA_DIR "/arch.json");
	EXPECT_EQ(config.machine, "raspberrypi4");
}

TEST(ArchConfig, Missing)
{
	ArchConfig config;
	config.machine = "foo";

	LoadConfigFile(config, TEST_DATA_DIR "/does-not-exist.conf", true);
	EXPECT_EQ(config.machine, "foo");

	try {
		LoadConfigFile(config, TEST_DATA_DIR "/does-not-exist.conf");
		FAIL();
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsFileNotFound(e));
	}
}

TEST(ArchConfig, UnknownOption)
{
	ArchConfig config;

	try {
		LoadConfigFile(config, TEST_DATA_DIR "/bad.conf");
		FAIL();
	} catch (const LineParser::Error &e) {
		EXPECT_EQ(GetFullMessage(e),
			  TEST_DATA_DIR "/bad.conf:2; Unknown option");
	}
}

TEST(ArchConfig, Environment)
{
	ArchConfig config;
	config.machine = "foo";

	unsetenv("SUPERVISOR_MACHINE");
	config.ApplyEnvironment();
	EXPECT_EQ(config.machine, "foo");

	setenv("SUPERVISOR_MACHINE", "", 1);
	config.ApplyEnvironment();
	EXPECT_EQ(config.machine, "foo");

	setenv("SUPERVISOR_MACHINE", "odroid-n2", 1);
	config.ApplyEnvironment();
	EXPECT_EQ(config.machine, "odroid-n2");

	unsetenv("SUPERVISOR_MACHINE");
}
