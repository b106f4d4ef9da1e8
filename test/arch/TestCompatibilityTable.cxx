// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "arch/CompatibilityTable.hxx"
#include "arch/Error.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(CompatibilityTable, Parse)
{
	const auto table = ParseCompatibilityTable(R"({"raspberrypi4": ["armv7","armhf"], "intel-nuc": ["amd64","i386"]})"sv);
	EXPECT_EQ(table.size(), 2U);

	const auto *rpi = table.Find("raspberrypi4"sv);
	ASSERT_NE(rpi, nullptr);
	EXPECT_EQ(*rpi, (std::vector<Arch>{Arch::ARMV7, Arch::ARMHF}));

	const auto *nuc = table.Find("intel-nuc"sv);
	ASSERT_NE(nuc, nullptr);
	EXPECT_EQ(*nuc, (std::vector<Arch>{Arch::AMD64, Arch::I386}));

	EXPECT_EQ(table.Find("raspberrypi"sv), nullptr);
	EXPECT_EQ(table.Find(""sv), nullptr);
}

TEST(CompatibilityTable, ParseEmpty)
{
	const auto table = ParseCompatibilityTable("{}"sv);
	EXPECT_TRUE(table.empty());

	const auto table2 = ParseCompatibilityTable(R"({"foo": []})"sv);
	const auto *foo = table2.Find("foo"sv);
	ASSERT_NE(foo, nullptr);
	EXPECT_TRUE(foo->empty());
}

TEST(CompatibilityTable, Malformed)
{
	EXPECT_THROW(ParseCompatibilityTable(""sv), ConfigFileError);
	EXPECT_THROW(ParseCompatibilityTable("{"sv), ConfigFileError);
	EXPECT_THROW(ParseCompatibilityTable("[]"sv), ConfigFileError);
	EXPECT_THROW(ParseCompatibilityTable(R"("armv7")"sv), ConfigFileError);
	EXPECT_THROW(ParseCompatibilityTable(R"({"foo": "armv7"})"sv), ConfigFileError);
	EXPECT_THROW(ParseCompatibilityTable(R"({"foo": [7]})"sv), ConfigFileError);
	EXPECT_THROW(ParseCompatibilityTable(R"({"foo": ["armv7", null]})"sv), ConfigFileError);
}

TEST(CompatibilityTable, NumberOverflow)
{
	EXPECT_THROW(ParseCompatibilityTable(R"({"x": 1e999})"sv), ConfigFileError);
	EXPECT_THROW(LoadCompatibilityTable(TEST_DATA_DIR "/overflow.json"),
		     ConfigFileError);
}

TEST(CompatibilityTable, UnknownArch)
{
	try {
		ParseCompatibilityTable(R"({"foo": ["armv7", "sparc"]})"sv);
		FAIL();
	} catch (const ConfigFileError &e) {
		EXPECT_EQ(std::string_view{e.what()},
			  "Unknown architecture 'sparc' for machine 'foo'"sv);
	}
}

TEST(CompatibilityTable, Load)
{
	const auto table = LoadCompatibilityTable(TEST_DATA_DIR "/arch.json");
	EXPECT_EQ(table.size(), 7U);

	const auto *nuc = table.Find("intel-nuc"sv);
	ASSERT_NE(nuc, nullptr);
	EXPECT_EQ(*nuc, (std::vector<Arch>{Arch::AMD64, Arch::I386}));
}

TEST(CompatibilityTable, LoadMissing)
{
	try {
		LoadCompatibilityTable(TEST_DATA_DIR "/does-not-exist.json");
		FAIL();
	} catch (const ConfigFileError &e) {
		/* the nested std::system_error describes the cause */
		const auto msg = GetFullMessage(e);
		EXPECT_NE(msg.find("does-not-exist.json"), msg.npos);
		EXPECT_NE(msg.find("; "), msg.npos);
	}
}

TEST(CompatibilityTable, LoadMalformed)
{
	EXPECT_THROW(LoadCompatibilityTable(TEST_DATA_DIR "/malformed.json"),
		     ConfigFileError);
}
