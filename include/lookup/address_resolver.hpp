#pragma once
#include <cstdint>
#include <vector>
#include "account/account_key.hpp"

class LookupTableStore;

// One address table lookup from a versioned transaction message.
struct LookupRequest {
  AccountKey table_key;
  std::vector<uint8_t> writable_indexes;
  std::vector<uint8_t> readonly_indexes;
};

struct ResolvedAddresses {
  std::vector<AccountKey> writable;
  std::vector<AccountKey> readonly;
};

// Turns lookup requests into addresses using only the tables already cached in
// a store. Output follows request order, then index order within a request.
class AddressResolver {
public:
  explicit AddressResolver(const LookupTableStore& store) : store_(store) {}
  // Throws AltError with TableNotFound, InvalidTableData or IndexOutOfRange.
  // Nothing is returned unless every request resolves.
  ResolvedAddresses Resolve(const std::vector<LookupRequest>& lookups) const;
private:
  const LookupTableStore& store_;
};
