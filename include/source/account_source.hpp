#pragma once
#include <cstddef>
#include <vector>
#include "account/account_key.hpp"

// Batched account fetcher. Fetch() returns at most one entry per requested key,
// in no particular order; keys without an account are omitted. Transport or
// protocol failures, and batches larger than MaxBatchSize(), throw
// AltError(AltErrorKind::FetchFailed, ...).
class AccountSource {
public:
  virtual ~AccountSource() = default;
  virtual std::vector<KeyedAccount> Fetch(const std::vector<AccountKey>& keys) = 0;
  // Largest key count accepted by a single Fetch() call.
  virtual size_t MaxBatchSize() const = 0;
};
