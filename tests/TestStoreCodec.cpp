#include "store/store_codec.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

TEST(StoreCodec, EmptyMap)
{
	const auto bytes = StoreCodec::Serialize({});
	EXPECT_EQ(bytes, std::vector<uint8_t>(8, 0));

	AccountMap map;
	map[MakeKey(1)] = {1};
	std::string error;
	ASSERT_TRUE(StoreCodec::Deserialize(bytes, map, error));
	EXPECT_TRUE(map.empty());
}

TEST(StoreCodec, Layout)
{
	AccountMap map;
	map[MakeKey(1)] = {0xaa, 0xbb};

	const auto bytes = StoreCodec::Serialize(map);
	ASSERT_EQ(bytes.size(), 8u + 32u + 8u + 2u);
	EXPECT_EQ(bytes[0], 1);
	EXPECT_EQ(bytes[8], MakeKey(1).bytes[0]);
	EXPECT_EQ(bytes[40], 2);
	EXPECT_EQ(bytes[48], 0xaa);
	EXPECT_EQ(bytes[49], 0xbb);
}

TEST(StoreCodec, RoundTripIsExact)
{
	AccountMap map;
	map[MakeKey(1)] = {};
	map[MakeKey(2)] = AccountData(1000, 0x5a);
	map[MakeKey(3)] = {0, 1, 2, 3};

	const auto bytes = StoreCodec::Serialize(map);
	AccountMap back;
	std::string error;
	ASSERT_TRUE(StoreCodec::Deserialize(bytes, back, error)) << error;
	EXPECT_EQ(back, map);

	/* deterministic regardless of hash order */
	EXPECT_EQ(StoreCodec::Serialize(back), bytes);
}

TEST(StoreCodec, RejectsMalformed)
{
	AccountMap map;
	map[MakeKey(1)] = {1, 2, 3};
	const auto good = StoreCodec::Serialize(map);

	AccountMap out;
	std::string error;

	EXPECT_FALSE(StoreCodec::Deserialize({1, 2, 3}, out, error));

	auto truncated = good;
	truncated.pop_back();
	EXPECT_FALSE(StoreCodec::Deserialize(truncated, out, error));

	auto trailing = good;
	trailing.push_back(0);
	EXPECT_FALSE(StoreCodec::Deserialize(trailing, out, error));

	auto huge_count = good;
	huge_count[7] = 0xff;
	EXPECT_FALSE(StoreCodec::Deserialize(huge_count, out, error));

	auto huge_length = good;
	huge_length[47] = 0x7f;
	EXPECT_FALSE(StoreCodec::Deserialize(huge_length, out, error));
	EXPECT_FALSE(error.empty());
	EXPECT_TRUE(out.empty());
}

TEST(StoreCodec, RepeatedKeyLastWins)
{
	std::vector<uint8_t> bytes{2, 0, 0, 0, 0, 0, 0, 0};
	const auto key = MakeKey(4);
	for (uint8_t value : {uint8_t(1), uint8_t(2)}) {
		bytes.insert(bytes.end(), key.bytes.begin(), key.bytes.end());
		std::vector<uint8_t> len{1, 0, 0, 0, 0, 0, 0, 0};
		bytes.insert(bytes.end(), len.begin(), len.end());
		bytes.push_back(value);
	}

	AccountMap out;
	std::string error;
	ASSERT_TRUE(StoreCodec::Deserialize(bytes, out, error)) << error;
	ASSERT_EQ(out.size(), 1u);
	EXPECT_EQ(out[key], AccountData{2});
}
