#include "lookup/lookup_table.hpp"
#include "encoding/bincode.hpp"
#include <utility>

namespace {
  constexpr uint32_t kStateUninitialized = 0;
  constexpr uint32_t kStateLookupTable = 1;
}

const char* LookupTableDecodeStatusName(LookupTableDecodeStatus status) {
  switch (status) {
    case LookupTableDecodeStatus::Ok: return "ok";
    case LookupTableDecodeStatus::TooShort: return "data shorter than table header";
    case LookupTableDecodeStatus::Uninitialized: return "table is uninitialized";
    case LookupTableDecodeStatus::InvalidStateTag: return "unknown table state tag";
    case LookupTableDecodeStatus::InvalidAuthorityTag: return "invalid authority option tag";
    case LookupTableDecodeStatus::MisalignedAddresses: return "address region is not a multiple of 32 bytes";
  }
  return "unknown";
}

LookupTableDecodeStatus LookupTable::Decode(const AccountData& data, LookupTable& out) {
  if (data.size() < kMetaSize) return LookupTableDecodeStatus::TooShort;

  Bincode::Reader meta(data.data(), kMetaSize);
  uint32_t state = 0;
  if (!meta.ReadU32(state)) return LookupTableDecodeStatus::TooShort;
  if (state == kStateUninitialized) return LookupTableDecodeStatus::Uninitialized;
  if (state != kStateLookupTable) return LookupTableDecodeStatus::InvalidStateTag;

  LookupTableMeta parsed;
  uint8_t authority_tag = 0;
  if (!meta.ReadU64(parsed.deactivation_slot) ||
      !meta.ReadU64(parsed.last_extended_slot) ||
      !meta.ReadU8(parsed.last_extended_slot_start_index) ||
      !meta.ReadU8(authority_tag)) {
    return LookupTableDecodeStatus::TooShort;
  }
  if (authority_tag == 1) {
    const uint8_t* key = nullptr;
    if (!meta.ReadBytes(AccountKey::kSize, key)) return LookupTableDecodeStatus::TooShort;
    parsed.authority = AccountKey::FromBytes(key);
  } else if (authority_tag != 0) {
    return LookupTableDecodeStatus::InvalidAuthorityTag;
  }
  // u16 padding follows; the rest of the header is zero fill.

  const size_t address_bytes = data.size() - kMetaSize;
  if (address_bytes % AccountKey::kSize != 0) return LookupTableDecodeStatus::MisalignedAddresses;

  std::vector<AccountKey> addresses;
  addresses.reserve(address_bytes / AccountKey::kSize);
  for (size_t off = kMetaSize; off < data.size(); off += AccountKey::kSize) {
    addresses.push_back(AccountKey::FromBytes(data.data() + off));
  }
  out.meta_ = std::move(parsed);
  out.addresses_ = std::move(addresses);
  return LookupTableDecodeStatus::Ok;
}

AccountData LookupTable::Encode(const LookupTableMeta& meta, const std::vector<AccountKey>& addresses) {
  Bincode::Writer w;
  w.WriteU32(kStateLookupTable);
  w.WriteU64(meta.deactivation_slot);
  w.WriteU64(meta.last_extended_slot);
  w.WriteU8(meta.last_extended_slot_start_index);
  if (meta.authority) {
    w.WriteU8(1);
    w.WriteBytes(meta.authority->bytes.data(), AccountKey::kSize);
  } else {
    w.WriteU8(0);
  }
  w.WriteU16(0);
  w.PadTo(kMetaSize);
  for (const auto& a : addresses) w.WriteBytes(a.bytes.data(), AccountKey::kSize);
  return w.Take();
}

bool LookupTable::Get(size_t index, AccountKey& out) const {
  if (index >= addresses_.size()) return false;
  out = addresses_[index];
  return true;
}
