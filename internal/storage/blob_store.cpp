#include "internal/storage/blob_store.hpp"

namespace mediaflow::storage {

std::string_view ToString(BlobErrorCode code) {
  switch (code) {
    case BlobErrorCode::kUnauthorized:
      return "unauthorized";
    case BlobErrorCode::kForbidden:
      return "forbidden";
    case BlobErrorCode::kQuotaExceeded:
      return "quota-exceeded";
    case BlobErrorCode::kCanceled:
      return "canceled";
    case BlobErrorCode::kNetwork:
      return "network";
    case BlobErrorCode::kTimeout:
      return "timeout";
    case BlobErrorCode::kUnknown:
      return "unknown";
  }
  return "unknown";
}

} // namespace mediaflow::storage
