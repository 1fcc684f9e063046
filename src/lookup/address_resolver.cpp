#include "lookup/address_resolver.hpp"
#include "common/alt_error.hpp"
#include "lookup/lookup_table.hpp"
#include "store/lookup_table_store.hpp"
#include <string>

static void AppendIndexed(const LookupTable& table,
                          const LookupRequest& lookup,
                          const std::vector<uint8_t>& indexes,
                          std::vector<AccountKey>& out) {
  for (uint8_t index : indexes) {
    AccountKey address;
    if (!table.Get(index, address)) {
      throw AltError(AltErrorKind::IndexOutOfRange,
                     "index " + std::to_string(index) + " out of range for table " +
                     lookup.table_key.ToBase58() + " with " + std::to_string(table.Size()) + " addresses");
    }
    out.push_back(address);
  }
}

ResolvedAddresses AddressResolver::Resolve(const std::vector<LookupRequest>& lookups) const {
  size_t writable_total = 0, readonly_total = 0;
  for (const auto& l : lookups) {
    writable_total += l.writable_indexes.size();
    readonly_total += l.readonly_indexes.size();
  }
  ResolvedAddresses out;
  out.writable.reserve(writable_total);
  out.readonly.reserve(readonly_total);

  auto view = store_.Read();
  for (const auto& lookup : lookups) {
    const AccountData* data = view.Find(lookup.table_key);
    if (!data) throw AltError(AltErrorKind::TableNotFound, lookup.table_key.ToBase58());

    LookupTable table;
    auto status = LookupTable::Decode(*data, table);
    if (status != LookupTableDecodeStatus::Ok) {
      throw AltError(AltErrorKind::InvalidTableData,
                     lookup.table_key.ToBase58() + ": " + LookupTableDecodeStatusName(status));
    }
    AppendIndexed(table, lookup, lookup.writable_indexes, out.writable);
    AppendIndexed(table, lookup, lookup.readonly_indexes, out.readonly);
  }
  return out;
}
