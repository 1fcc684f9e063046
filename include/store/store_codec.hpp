#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "account/account_key.hpp"

// On-disk layout of the lookup table store (bincode HashMap<Pubkey, Vec<u8>>):
//   u64 entry count, then per entry: 32 key bytes, u64 data length, data bytes.
namespace StoreCodec {
  // Entries are written in ascending key order.
  std::vector<uint8_t> Serialize(const AccountMap& map);
  // Rejects truncated input, lengths past the end and trailing bytes.
  bool Deserialize(const std::vector<uint8_t>& bytes, AccountMap& out, std::string& error);
}
