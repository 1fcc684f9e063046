#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

// 32-byte on-chain account address.
struct AccountKey {
  static constexpr size_t kSize = 32;
  std::array<uint8_t, kSize> bytes{};

  // Throws std::invalid_argument unless the text decodes to exactly 32 bytes.
  static AccountKey FromBase58(const std::string& text);
  static AccountKey FromBytes(const uint8_t* data);
  std::string ToBase58() const;

  bool operator==(const AccountKey& o) const { return bytes == o.bytes; }
  bool operator!=(const AccountKey& o) const { return bytes != o.bytes; }
  bool operator<(const AccountKey& o) const { return bytes < o.bytes; }
};

struct AccountKeyHash {
  size_t operator()(const AccountKey& key) const;
};

// Raw account content as returned by the data source.
using AccountData = std::vector<uint8_t>;

struct KeyedAccount {
  AccountKey key;
  AccountData data;
};

using AccountMap = std::unordered_map<AccountKey, AccountData, AccountKeyHash>;
