#include "lookup/lookup_table.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

static const std::vector<AccountKey> kAddresses{MakeKey(10), MakeKey(20), MakeKey(30)};

TEST(LookupTable, DecodeActiveTable)
{
	LookupTableMeta meta;
	meta.last_extended_slot = 1234;
	meta.last_extended_slot_start_index = 2;
	meta.authority = MakeKey(99);

	const auto data = LookupTable::Encode(meta, kAddresses);
	ASSERT_EQ(data.size(), LookupTable::kMetaSize + 3 * 32);

	LookupTable table;
	ASSERT_EQ(LookupTable::Decode(data, table), LookupTableDecodeStatus::Ok);
	EXPECT_TRUE(table.IsActive());
	EXPECT_EQ(table.Meta().last_extended_slot, 1234u);
	EXPECT_EQ(table.Meta().last_extended_slot_start_index, 2u);
	ASSERT_TRUE(table.Meta().authority.has_value());
	EXPECT_EQ(*table.Meta().authority, MakeKey(99));
	EXPECT_EQ(table.Addresses(), kAddresses);

	AccountKey out;
	ASSERT_TRUE(table.Get(2, out));
	EXPECT_EQ(out, MakeKey(30));
	EXPECT_FALSE(table.Get(3, out));
}

TEST(LookupTable, FrozenEmptyTable)
{
	LookupTableMeta meta;
	meta.deactivation_slot = 500;

	LookupTable table;
	ASSERT_EQ(LookupTable::Decode(LookupTable::Encode(meta, {}), table),
		  LookupTableDecodeStatus::Ok);
	EXPECT_FALSE(table.IsActive());
	EXPECT_FALSE(table.Meta().authority.has_value());
	EXPECT_EQ(table.Size(), 0u);
}

TEST(LookupTable, HeaderLayout)
{
	LookupTableMeta meta;
	meta.deactivation_slot = 0x0102030405060708ULL;
	const auto data = LookupTable::Encode(meta, {});

	/* state tag 1, little endian */
	EXPECT_EQ(data[0], 1);
	EXPECT_EQ(data[1], 0);
	EXPECT_EQ(data[4], 0x08);
	EXPECT_EQ(data[11], 0x01);
	/* authority option tag */
	EXPECT_EQ(data[21], 0);
}

TEST(LookupTable, TooShort)
{
	LookupTable table;
	EXPECT_EQ(LookupTable::Decode({}, table), LookupTableDecodeStatus::TooShort);
	EXPECT_EQ(LookupTable::Decode(AccountData(55, 0), table),
		  LookupTableDecodeStatus::TooShort);
}

TEST(LookupTable, Uninitialized)
{
	LookupTable table;
	EXPECT_EQ(LookupTable::Decode(AccountData(56, 0), table),
		  LookupTableDecodeStatus::Uninitialized);
}

TEST(LookupTable, BadTags)
{
	auto data = LookupTable::Encode({}, kAddresses);
	LookupTable table;

	auto bad_state = data;
	bad_state[0] = 2;
	EXPECT_EQ(LookupTable::Decode(bad_state, table),
		  LookupTableDecodeStatus::InvalidStateTag);

	auto bad_authority = data;
	bad_authority[21] = 7;
	EXPECT_EQ(LookupTable::Decode(bad_authority, table),
		  LookupTableDecodeStatus::InvalidAuthorityTag);
}

TEST(LookupTable, MisalignedAddresses)
{
	auto data = LookupTable::Encode({}, kAddresses);
	data.pop_back();

	LookupTable table;
	EXPECT_EQ(LookupTable::Decode(data, table),
		  LookupTableDecodeStatus::MisalignedAddresses);
}

TEST(LookupTable, DecodeDoesNotTouchOutputOnFailure)
{
	LookupTable table;
	ASSERT_EQ(LookupTable::Decode(LookupTable::Encode({}, kAddresses), table),
		  LookupTableDecodeStatus::Ok);

	EXPECT_EQ(LookupTable::Decode(AccountData(10, 0), table),
		  LookupTableDecodeStatus::TooShort);
	EXPECT_EQ(table.Size(), 3u);
}
