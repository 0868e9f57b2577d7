#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string_view>

namespace mediaflow::storage::common {

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool ContainsAny(const std::string& haystack, std::initializer_list<std::string_view> needles) {
  for (auto needle : needles) {
    if (haystack.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri_or_path) {
  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri_or_path, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

BlobErrorCode ClassifyStatus(const arrow::Status& status) {
  if (status.ok()) {
    return BlobErrorCode::kUnknown;
  }
  if (status.IsCancelled()) {
    return BlobErrorCode::kCanceled;
  }

  const auto message = Lower(status.message());

  if (ContainsAny(message, {"unauthorized", "invalidaccesskeyid", "signaturedoesnotmatch", "expiredtoken", "http 401"})) {
    return BlobErrorCode::kUnauthorized;
  }
  if (ContainsAny(message, {"access denied", "accessdenied", "forbidden", "permission denied", "http 403"})) {
    return BlobErrorCode::kForbidden;
  }
  if (ContainsAny(message, {"quota", "no space left", "disk full", "entitytoolarge", "slowdown"})) {
    return BlobErrorCode::kQuotaExceeded;
  }
  if (ContainsAny(message, {"timed out", "timeout"})) {
    return BlobErrorCode::kTimeout;
  }
  if (ContainsAny(message, {"network", "connection", "resolve host", "curl", "broken pipe", "unreachable"})) {
    return BlobErrorCode::kNetwork;
  }
  return BlobErrorCode::kUnknown;
}

} // namespace mediaflow::storage::common
