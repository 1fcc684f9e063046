#pragma once
#include <stdexcept>
#include <string>

enum class AltErrorKind {
  FetchFailed,
  StoreCorrupt,
  PersistFailed,
  TableNotFound,
  InvalidTableData,
  IndexOutOfRange
};

const char* AltErrorKindName(AltErrorKind kind);

// Raised by the store, the account sources and the resolver.
class AltError : public std::runtime_error {
public:
  AltError(AltErrorKind kind, const std::string& message);
  AltErrorKind Kind() const { return kind_; }
private:
  AltErrorKind kind_;
};
