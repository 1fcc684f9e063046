#pragma once
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include "account/account_key.hpp"

class AccountSource;

// How to handle keys already present in the store.
enum class UpdateMode {
  Append,    // fetch only keys not yet stored
  Overwrite  // refetch every requested key
};

// Persistent cache of lookup table account data keyed by table address.
// Readers share the map; Update() calls are serialized and every successful
// update is written back to the backing file.
class LookupTableStore {
public:
  // Shared read access held for the lifetime of the view.
  class ReadView {
  public:
    // Returns nullptr when the key is not stored.
    const AccountData* Find(const AccountKey& key) const;
    size_t Size() const { return map_->size(); }
  private:
    friend class LookupTableStore;
    ReadView(std::shared_mutex& mu, const AccountMap& map) : lock_(mu), map_(&map) {}
    std::shared_lock<std::shared_mutex> lock_;
    const AccountMap* map_;
  };

  // Loads path if it exists, otherwise creates it holding an empty store.
  // Throws AltError with StoreCorrupt for unreadable or undecodable files and
  // PersistFailed when the new file cannot be written.
  static std::unique_ptr<LookupTableStore> LoadOrCreate(const std::string& path, AccountSource& source);

  bool Contains(const AccountKey& key) const;
  size_t Size() const;
  bool Get(const AccountKey& key, AccountData& out) const;
  ReadView Read() const;

  // Fetches missing (Append) or all (Overwrite) keys from the source in batches,
  // merges whatever was found and saves. Keys the source does not return are
  // dropped. Source errors propagate before anything is merged.
  void Update(const std::vector<AccountKey>& keys, UpdateMode mode = UpdateMode::Append);
  // Atomically replaces the backing file. Throws AltError(PersistFailed).
  void Save();

  const std::string& Path() const { return path_; }
private:
  LookupTableStore(const std::string& path, AccountSource& source, AccountMap map);
  std::vector<AccountKey> SelectFetchKeys(const std::vector<AccountKey>& keys, UpdateMode mode) const;
  std::vector<KeyedAccount> FetchInBatches(const std::vector<AccountKey>& keys);

  std::string path_;
  AccountSource& source_;
  mutable std::shared_mutex mu_;
  std::mutex update_mutex_;
  std::mutex persist_mutex_;
  AccountMap map_;
};
