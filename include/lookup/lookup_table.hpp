#pragma once
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>
#include "account/account_key.hpp"

enum class LookupTableDecodeStatus {
  Ok,
  TooShort,             // fewer bytes than the metadata header
  Uninitialized,        // state tag 0
  InvalidStateTag,
  InvalidAuthorityTag,
  MisalignedAddresses   // address region is not a whole number of keys
};

const char* LookupTableDecodeStatusName(LookupTableDecodeStatus status);

struct LookupTableMeta {
  static constexpr uint64_t kActiveSlot = std::numeric_limits<uint64_t>::max();
  uint64_t deactivation_slot = kActiveSlot;
  uint64_t last_extended_slot = 0;
  uint8_t last_extended_slot_start_index = 0;
  std::optional<AccountKey> authority;
};

// Decoded address lookup table account: a 56-byte metadata header followed by
// the table's addresses, 32 bytes each.
class LookupTable {
public:
  static constexpr size_t kMetaSize = 56;

  static LookupTableDecodeStatus Decode(const AccountData& data, LookupTable& out);
  static AccountData Encode(const LookupTableMeta& meta, const std::vector<AccountKey>& addresses);

  const LookupTableMeta& Meta() const { return meta_; }
  bool IsActive() const { return meta_.deactivation_slot == LookupTableMeta::kActiveSlot; }
  size_t Size() const { return addresses_.size(); }
  // Returns false when index is past the end of the table.
  bool Get(size_t index, AccountKey& out) const;
  const std::vector<AccountKey>& Addresses() const { return addresses_; }
private:
  LookupTableMeta meta_;
  std::vector<AccountKey> addresses_;
};
