#include "account/account_key.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <unordered_set>

TEST(AccountKey, DefaultIsSystemProgram)
{
	/* 32 zero bytes print as 32 '1' characters */
	AccountKey key;
	EXPECT_EQ(key.ToBase58(), std::string(32, '1'));
	EXPECT_EQ(AccountKey::FromBase58(std::string(32, '1')), key);
}

TEST(AccountKey, KnownAddress)
{
	const std::string text = "AddressLookupTab1e1111111111111111111111111";
	const auto key = AccountKey::FromBase58(text);
	EXPECT_EQ(key.ToBase58(), text);
	EXPECT_NE(key, AccountKey{});
}

TEST(AccountKey, RejectsBadInput)
{
	EXPECT_THROW(AccountKey::FromBase58("0OIl"), std::invalid_argument);
	EXPECT_THROW(AccountKey::FromBase58("abc"), std::invalid_argument);
	EXPECT_THROW(AccountKey::FromBase58(std::string(33, '1')), std::invalid_argument);
}

TEST(AccountKey, OrderingAndHash)
{
	AccountKey a, b;
	b.bytes[31] = 1;
	EXPECT_TRUE(a < b);
	EXPECT_FALSE(b < a);

	std::unordered_set<AccountKey, AccountKeyHash> set;
	set.insert(a);
	set.insert(b);
	set.insert(a);
	EXPECT_EQ(set.size(), 2u);
}

TEST(AccountKey, LeadingZeroBytes)
{
	/* each leading zero byte becomes one leading '1' */
	AccountKey key;
	key.bytes[2] = 0x01;
	key.bytes[31] = 0xff;
	const auto text = key.ToBase58();
	EXPECT_EQ(text.substr(0, 2), "11");
	EXPECT_NE(text[2], '1');
	EXPECT_EQ(AccountKey::FromBase58(text), key);
}

TEST(AccountKey, RejectsEmpty)
{
	EXPECT_THROW(AccountKey::FromBase58(""), std::invalid_argument);
}

TEST(AccountKey, RejectsShortKey)
{
	AccountKey key;
	key.bytes.fill(0xff);
	const auto text = key.ToBase58();
	/* dropping two digits divides the value by 58^2, leaving 31 bytes */
	EXPECT_THROW(AccountKey::FromBase58(text.substr(0, text.size() - 2)), std::invalid_argument);
}
