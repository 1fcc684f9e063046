#include "store/store_codec.hpp"
#include "encoding/bincode.hpp"
#include <algorithm>
#include <utility>

namespace StoreCodec {
  std::vector<uint8_t> Serialize(const AccountMap& map) {
    std::vector<const AccountMap::value_type*> entries;
    entries.reserve(map.size());
    for (const auto& kv : map) {
      entries.push_back(&kv);
    }
    std::sort(entries.begin(), entries.end(), [](const auto* a, const auto* b){ return a->first < b->first; });

    Bincode::Writer w;
    w.WriteU64(static_cast<uint64_t>(entries.size()));
    for (const auto* e : entries) {
      w.WriteBytes(e->first.bytes.data(), AccountKey::kSize);
      w.WriteU64(static_cast<uint64_t>(e->second.size()));
      w.WriteBytes(e->second.data(), e->second.size());
    }
    return w.Take();
  }

  bool Deserialize(const std::vector<uint8_t>& bytes, AccountMap& out, std::string& error) {
    Bincode::Reader r(bytes);
    uint64_t count = 0;
    if (!r.ReadU64(count)) {
      error = "truncated entry count";
      return false;
    }
    // Every entry needs at least a key and a length.
    const uint64_t min_entry = AccountKey::kSize + sizeof(uint64_t);
    if (count > r.Remaining() / min_entry) {
      error = "entry count " + std::to_string(count) + " exceeds file size";
      return false;
    }
    AccountMap parsed;
    parsed.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
      const uint8_t* key_bytes = nullptr;
      uint64_t len = 0;
      if (!r.ReadBytes(AccountKey::kSize, key_bytes) || !r.ReadU64(len)) {
        error = "truncated entry " + std::to_string(i);
        return false;
      }
      const uint8_t* data = nullptr;
      if (len > r.Remaining() || !r.ReadBytes(static_cast<size_t>(len), data)) {
        error = "entry " + std::to_string(i) + " data length " + std::to_string(len) + " exceeds file size";
        return false;
      }
      parsed[AccountKey::FromBytes(key_bytes)] = AccountData(data, data + len);
    }
    if (r.Remaining() != 0) {
      error = std::to_string(r.Remaining()) + " trailing bytes after " + std::to_string(count) + " entries";
      return false;
    }
    out = std::move(parsed);
    return true;
  }
}
