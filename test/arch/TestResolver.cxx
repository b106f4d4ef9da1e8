// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "arch/Resolver.hxx"
#include "arch/CompatibilityTable.hxx"
#include "arch/Error.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <vector>

using std::string_view_literals::operator""sv;

namespace {

class FakeSupervisor final : public SupervisorInfo {
public:
	Arch arch = Arch::ARMV7;

	Arch GetArch() const noexcept override {
		return arch;
	}
};

static ArchConfig
MakeConfig(const char *machine, const char *table=TEST_DATA_DIR "/arch.json")
{
	ArchConfig config;
	config.table_path = table;
	config.machine = machine;
	return config;
}

static std::vector<Arch>
ToVector(std::span<const Arch> src)
{
	return {src.begin(), src.end()};
}

/**
 * Verify the invariants which must hold after Load().
 */
static void
CheckInvariants(const ArchResolver &resolver)
{
	const auto supported = resolver.GetSupported();
	ASSERT_FALSE(supported.empty());

	EXPECT_NE(std::find(supported.begin(), supported.end(),
			    resolver.GetDefault()),
		  supported.end());

	EXPECT_EQ(resolver.GetSupportedSet(), ArchSet{supported});
}

} // anonymous namespace

TEST(ArchResolver, Empty)
{
	const FakeSupervisor supervisor;
	const ArchResolver resolver(MakeConfig("intel-nuc"), "x86_64"sv,
				    supervisor);

	EXPECT_EQ(resolver.GetDefault(), Arch::NONE);
	EXPECT_TRUE(resolver.GetSupported().empty());
	EXPECT_TRUE(resolver.GetSupportedSet().empty());

	static constexpr std::array all{
		Arch::ARMV7, Arch::ARMHF, Arch::AARCH64,
		Arch::I386, Arch::AMD64,
	};

	EXPECT_FALSE(resolver.IsSupported(all));
	EXPECT_THROW(resolver.Match(all), ArchNotFoundError);
}

TEST(ArchResolver, TableMissing)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("intel-nuc",
					 TEST_DATA_DIR "/does-not-exist.json"),
			      "x86_64"sv, supervisor);

	EXPECT_FALSE(resolver.Load());
	EXPECT_EQ(resolver.GetDefault(), Arch::NONE);
	EXPECT_TRUE(resolver.GetSupported().empty());
	EXPECT_TRUE(resolver.GetSupportedSet().empty());

	static constexpr std::array amd64{Arch::AMD64};
	EXPECT_FALSE(resolver.IsSupported(amd64));
	EXPECT_THROW(resolver.Match(amd64), ArchNotFoundError);
}

TEST(ArchResolver, TableMalformed)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("", TEST_DATA_DIR "/malformed.json"),
			      "x86_64"sv, supervisor);

	EXPECT_FALSE(resolver.Load());
	EXPECT_TRUE(resolver.GetSupported().empty());
	EXPECT_TRUE(resolver.GetSupportedSet().empty());
}

TEST(ArchResolver, TableNumberOverflow)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("intel-nuc",
					 TEST_DATA_DIR "/overflow.json"),
			      "x86_64"sv, supervisor);

	EXPECT_FALSE(resolver.Load());
	EXPECT_EQ(resolver.GetDefault(), Arch::NONE);
	EXPECT_TRUE(resolver.GetSupported().empty());
	EXPECT_TRUE(resolver.GetSupportedSet().empty());
}

TEST(ArchResolver, MachineUnknown)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig(""), "armv7l"sv, supervisor);

	ASSERT_TRUE(resolver.Load());
	CheckInvariants(resolver);
	EXPECT_EQ(resolver.GetDefault(), resolver.DetectCpu());
	EXPECT_EQ(resolver.GetDefault(), Arch::ARMV7);
	EXPECT_EQ(ToVector(resolver.GetSupported()),
		  std::vector<Arch>{Arch::ARMV7});
}

TEST(ArchResolver, MachineUnknownAarch64)
{
	/* without a machine type, the aarch64 special case does not
	   apply */
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig(""), "aarch64"sv, supervisor);

	ASSERT_TRUE(resolver.Load());
	CheckInvariants(resolver);
	EXPECT_EQ(resolver.GetDefault(), Arch::AARCH64);
	EXPECT_EQ(ToVector(resolver.GetSupported()),
		  std::vector<Arch>{Arch::AARCH64});
}

TEST(ArchResolver, MachineInTable)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("intel-nuc"), "x86_64"sv, supervisor);

	ASSERT_TRUE(resolver.Load());
	CheckInvariants(resolver);
	EXPECT_EQ(resolver.GetDefault(), Arch::AMD64);
	EXPECT_EQ(ToVector(resolver.GetSupported()),
		  (std::vector<Arch>{Arch::AMD64, Arch::I386}));
}

TEST(ArchResolver, NativeAppended)
{
	/* a 32 bit ARM kernel on a board whose table entry lacks
	   "armv7" */
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("raspberrypi"), "armv7l"sv,
			      supervisor);

	ASSERT_TRUE(resolver.Load());
	CheckInvariants(resolver);
	EXPECT_EQ(resolver.GetDefault(), Arch::ARMHF);
	EXPECT_EQ(ToVector(resolver.GetSupported()),
		  (std::vector<Arch>{Arch::ARMHF, Arch::ARMV7}));
}

TEST(ArchResolver, NativeNotDuplicated)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("raspberrypi4"), "armv6l"sv,
			      supervisor);

	ASSERT_TRUE(resolver.Load());
	CheckInvariants(resolver);
	EXPECT_EQ(resolver.GetDefault(), Arch::ARMV7);
	EXPECT_EQ(ToVector(resolver.GetSupported()),
		  (std::vector<Arch>{Arch::ARMV7, Arch::ARMHF}));
}

TEST(ArchResolver, MachineNotInTable)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("no-such-board"), "i686"sv,
			      supervisor);

	ASSERT_TRUE(resolver.Load());
	CheckInvariants(resolver);
	EXPECT_EQ(resolver.GetDefault(), Arch::I386);
	EXPECT_EQ(ToVector(resolver.GetSupported()),
		  std::vector<Arch>{Arch::I386});
}

TEST(ArchResolver, MachineEmptyList)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("empty"), "x86_64"sv, supervisor);

	ASSERT_TRUE(resolver.Load());
	CheckInvariants(resolver);
	EXPECT_EQ(resolver.GetDefault(), Arch::AMD64);
	EXPECT_EQ(ToVector(resolver.GetSupported()),
		  std::vector<Arch>{Arch::AMD64});
}

TEST(ArchResolver, Aarch64Machine)
{
	/* the table says "armhf" for this machine type, but the
	   aarch64 special case ignores the table */
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("aarch64"), "x86_64"sv, supervisor);

	ASSERT_TRUE(resolver.Load());
	CheckInvariants(resolver);
	EXPECT_EQ(resolver.GetDefault(), Arch::AARCH64);
	EXPECT_EQ(ToVector(resolver.GetSupported()),
		  (std::vector<Arch>{Arch::AARCH64, Arch::ARMV7, Arch::ARMHF}));
}

TEST(ArchResolver, Aarch64Cpu)
{
	const FakeSupervisor supervisor;

	for (const char *machine : {"raspberrypi4", "intel-nuc", "no-such-board"}) {
		ArchResolver resolver(MakeConfig(machine), "aarch64"sv,
				      supervisor);

		ASSERT_TRUE(resolver.Load());
		CheckInvariants(resolver);
		EXPECT_EQ(resolver.GetDefault(), Arch::AARCH64);
		EXPECT_EQ(ToVector(resolver.GetSupported()),
			  (std::vector<Arch>{Arch::AARCH64, Arch::ARMV7, Arch::ARMHF}));
	}
}

TEST(ArchResolver, Setup)
{
	CompatibilityTable table;
	table.Add("board"sv, {Arch::I386});

	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("board"), "x86_64"sv, supervisor);
	resolver.Setup(table);

	CheckInvariants(resolver);
	EXPECT_EQ(resolver.GetDefault(), Arch::I386);
	EXPECT_EQ(ToVector(resolver.GetSupported()),
		  (std::vector<Arch>{Arch::I386, Arch::AMD64}));
}

TEST(ArchResolver, Reload)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("intel-nuc"), "x86_64"sv, supervisor);

	ASSERT_TRUE(resolver.Load());
	ASSERT_TRUE(resolver.Load());
	EXPECT_EQ(ToVector(resolver.GetSupported()),
		  (std::vector<Arch>{Arch::AMD64, Arch::I386}));
}

TEST(ArchResolver, IsSupported)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("raspberrypi4"), "armv7l"sv,
			      supervisor);
	ASSERT_TRUE(resolver.Load());

	static constexpr std::array armhf{Arch::ARMHF};
	static constexpr std::array x86{Arch::AMD64, Arch::I386};
	static constexpr std::array mixed{Arch::AMD64, Arch::ARMV7};
	static constexpr std::array unknown{Arch::NONE};

	EXPECT_TRUE(resolver.IsSupported(armhf));
	EXPECT_FALSE(resolver.IsSupported(x86));
	EXPECT_TRUE(resolver.IsSupported(mixed));
	EXPECT_FALSE(resolver.IsSupported(unknown));
	EXPECT_FALSE(resolver.IsSupported({}));
}

TEST(ArchResolver, Match)
{
	const FakeSupervisor supervisor;
	ArchResolver resolver(MakeConfig("raspberrypi4-64"), "armv7l"sv,
			      supervisor);
	ASSERT_TRUE(resolver.Load());

	/* the resolver's order of preference decides, not the order
	   of the parameter */
	static constexpr std::array a{Arch::ARMHF, Arch::ARMV7};
	EXPECT_EQ(resolver.Match(a), Arch::ARMV7);

	static constexpr std::array b{Arch::ARMHF, Arch::AARCH64};
	EXPECT_EQ(resolver.Match(b), Arch::AARCH64);

	static constexpr std::array c{Arch::AMD64, Arch::ARMHF};
	EXPECT_EQ(resolver.Match(c), Arch::ARMHF);

	static constexpr std::array x86{Arch::AMD64, Arch::I386};
	EXPECT_THROW(resolver.Match(x86), ArchNotFoundError);
	EXPECT_THROW(resolver.Match({}), ArchNotFoundError);
}

TEST(ArchResolver, Supervisor)
{
	FakeSupervisor supervisor;
	const ArchResolver resolver(MakeConfig("intel-nuc"), "x86_64"sv,
				    supervisor);

	EXPECT_EQ(resolver.GetSupervisor(), Arch::ARMV7);
	supervisor.arch = Arch::AMD64;
	EXPECT_EQ(resolver.GetSupervisor(), Arch::AMD64);
}
