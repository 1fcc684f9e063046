#include "store/lookup_table_store.hpp"
#include "common/alt_error.hpp"
#include "common/logger.hpp"
#include "source/account_source.hpp"
#include "store/store_codec.hpp"
#include "utils/file_io.hpp"
#include <algorithm>
#include <filesystem>
#include <unordered_set>
#include <utility>

const AccountData* LookupTableStore::ReadView::Find(const AccountKey& key) const {
  auto it = map_->find(key);
  if (it == map_->end()) return nullptr;
  return &it->second;
}

LookupTableStore::LookupTableStore(const std::string& path, AccountSource& source, AccountMap map)
  : path_(path), source_(source), map_(std::move(map)) {}

std::unique_ptr<LookupTableStore> LookupTableStore::LoadOrCreate(const std::string& path, AccountSource& source) {
  std::error_code ec;
  const bool exists = std::filesystem::exists(path, ec);
  if (ec) throw AltError(AltErrorKind::StoreCorrupt, "cannot stat " + path + ": " + ec.message());

  if (!exists) {
    std::unique_ptr<LookupTableStore> store(new LookupTableStore(path, source, AccountMap{}));
    store->Save();
    ALT_LOG_INFO("Created empty lookup table store at " + path);
    return store;
  }

  std::vector<uint8_t> bytes;
  std::string error;
  if (!FileIO::ReadFileBytes(path, bytes, error)) {
    throw AltError(AltErrorKind::StoreCorrupt, error);
  }
  AccountMap map;
  // Saves always write at least the entry count, so a zero-length file only
  // comes from tools that create the store without saving it.
  if (bytes.empty()) {
    ALT_LOG_WARNING("Lookup table store " + path + " is empty, treating it as a store with no tables");
  } else if (!StoreCodec::Deserialize(bytes, map, error)) {
    ALT_LOG_ERROR("Lookup table store " + path + " is corrupt: " + error);
    throw AltError(AltErrorKind::StoreCorrupt, path + ": " + error);
  }
  ALT_LOG_INFO("Loaded " + std::to_string(map.size()) + " lookup tables from " + path);
  return std::unique_ptr<LookupTableStore>(new LookupTableStore(path, source, std::move(map)));
}

bool LookupTableStore::Contains(const AccountKey& key) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return map_.count(key) != 0;
}

size_t LookupTableStore::Size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return map_.size();
}

bool LookupTableStore::Get(const AccountKey& key, AccountData& out) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = map_.find(key);
  if (it == map_.end()) return false;
  out = it->second;
  return true;
}

LookupTableStore::ReadView LookupTableStore::Read() const {
  return ReadView(mu_, map_);
}

std::vector<AccountKey> LookupTableStore::SelectFetchKeys(const std::vector<AccountKey>& keys, UpdateMode mode) const {
  std::vector<AccountKey> out;
  out.reserve(keys.size());
  std::unordered_set<AccountKey, AccountKeyHash> seen;
  std::shared_lock<std::shared_mutex> lock(mu_);
  for (const auto& k : keys) {
    if (!seen.insert(k).second) continue;
    if (mode == UpdateMode::Append && map_.count(k) != 0) continue;
    out.push_back(k);
  }
  return out;
}

std::vector<KeyedAccount> LookupTableStore::FetchInBatches(const std::vector<AccountKey>& keys) {
  const size_t batch = std::max<size_t>(1, source_.MaxBatchSize());
  std::vector<KeyedAccount> fetched;
  fetched.reserve(keys.size());
  for (size_t start = 0; start < keys.size(); start += batch) {
    const size_t end = std::min(keys.size(), start + batch);
    std::vector<AccountKey> chunk(keys.begin() + static_cast<std::ptrdiff_t>(start),
                                  keys.begin() + static_cast<std::ptrdiff_t>(end));
    auto part = source_.Fetch(chunk);
    for (auto& a : part) fetched.push_back(std::move(a));
  }
  return fetched;
}

void LookupTableStore::Update(const std::vector<AccountKey>& keys, UpdateMode mode) {
  std::lock_guard<std::mutex> update_lock(update_mutex_);
  auto fetch_keys = SelectFetchKeys(keys, mode);
  if (fetch_keys.empty()) {
    ALT_LOG_DEBUG("Update skipped, all " + std::to_string(keys.size()) + " tables already stored");
    return;
  }

  // The fetch runs without the map lock; readers keep going meanwhile.
  auto fetched = FetchInBatches(fetch_keys);
  const size_t found = fetched.size();
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    for (auto& a : fetched) map_[a.key] = std::move(a.data);
  }
  if (found < fetch_keys.size()) {
    ALT_LOG_WARNING(std::to_string(fetch_keys.size() - found) + " of " + std::to_string(fetch_keys.size()) +
                    " lookup tables were not found");
  }
  ALT_LOG_INFO("Fetched " + std::to_string(found) + " lookup tables (" +
               (mode == UpdateMode::Append ? "append" : "overwrite") + ")");
  Save();
}

void LookupTableStore::Save() {
  std::lock_guard<std::mutex> persist_lock(persist_mutex_);
  std::vector<uint8_t> bytes;
  size_t entries = 0;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    bytes = StoreCodec::Serialize(map_);
    entries = map_.size();
  }
  std::string error;
  if (!FileIO::WriteFileAtomic(path_, bytes, error)) {
    ALT_LOG_ERROR("Saving lookup table store failed: " + error);
    throw AltError(AltErrorKind::PersistFailed, error);
  }
  ALT_LOG_DEBUG("Saved " + std::to_string(entries) + " lookup tables to " + path_);
}
