#include "account/account_key.hpp"
#include <libbase58.h>
#include <cstring>
#include <stdexcept>

AccountKey AccountKey::FromBase58(const std::string& text) {
  // b58tobin right-aligns the result and reports its length, leading zero bytes included
  uint8_t raw[kSize * 2];
  size_t raw_size = sizeof(raw);
  if (text.empty() || !b58tobin(raw, &raw_size, text.data(), text.size())) {
    throw std::invalid_argument("invalid base58 account key: " + text);
  }
  if (raw_size != kSize) {
    throw std::invalid_argument("account key must be 32 bytes, got " + std::to_string(raw_size) + ": " + text);
  }
  return FromBytes(raw + sizeof(raw) - raw_size);
}

AccountKey AccountKey::FromBytes(const uint8_t* data) {
  AccountKey key;
  std::memcpy(key.bytes.data(), data, kSize);
  return key;
}

std::string AccountKey::ToBase58() const {
  char encoded[64];
  size_t encoded_size = sizeof(encoded);
  if (!b58enc(encoded, &encoded_size, bytes.data(), bytes.size())) {
    throw std::runtime_error("base58 encoding failed");
  }
  return std::string(encoded, encoded_size - 1);
}

size_t AccountKeyHash::operator()(const AccountKey& key) const {
  uint64_t h = 0xcbf29ce484222325ULL;
  for (size_t i = 0; i < AccountKey::kSize; i += sizeof(uint64_t)) {
    uint64_t chunk = 0;
    std::memcpy(&chunk, key.bytes.data() + i, sizeof(chunk));
    h = (h ^ chunk) * 0x100000001b3ULL;
    h ^= h >> 29;
  }
  return static_cast<size_t>(h);
}
