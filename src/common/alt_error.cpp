#include "common/alt_error.hpp"

const char* AltErrorKindName(AltErrorKind kind) {
  switch (kind) {
    case AltErrorKind::FetchFailed: return "FetchFailed";
    case AltErrorKind::StoreCorrupt: return "StoreCorrupt";
    case AltErrorKind::PersistFailed: return "PersistFailed";
    case AltErrorKind::TableNotFound: return "TableNotFound";
    case AltErrorKind::InvalidTableData: return "InvalidTableData";
    case AltErrorKind::IndexOutOfRange: return "IndexOutOfRange";
  }
  return "Unknown";
}

AltError::AltError(AltErrorKind kind, const std::string& message)
  : std::runtime_error(std::string(AltErrorKindName(kind)) + ": " + message), kind_(kind) {}
