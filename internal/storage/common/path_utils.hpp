#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace mediaflow::storage::common {

/*
  Object keys are '/'-separated relative paths. Absolute keys, empty
  segments and dot segments are rejected so a key can never escape the
  store root.
*/
inline void ValidateObjectKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("object key must not be empty");
  }
  if (key.front() == '/') {
    throw std::invalid_argument("object key must be relative");
  }

  std::string_view rest(key);
  while (!rest.empty()) {
    const auto       slash   = rest.find('/');
    std::string_view segment = rest.substr(0, slash);
    if (segment.empty() || segment == "." || segment == "..") {
      throw std::invalid_argument("object key contains an invalid segment: " + key);
    }
    for (char c : segment) {
      if (c == '\\' || c == '\0') {
        throw std::invalid_argument("object key contains invalid character");
      }
    }
    if (slash == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(slash + 1);
  }
}

inline std::string JoinPath(const std::string& root, const std::string& key) {
  if (root.empty()) {
    return key;
  }
  if (root.back() == '/') {
    return root + key;
  }
  return root + "/" + key;
}

// "a/b/c.jpg" -> "a/b"; "c.jpg" -> ""
inline std::string ParentPath(const std::string& path) {
  const auto slash = path.rfind('/');
  if (slash == std::string::npos) {
    return {};
  }
  return path.substr(0, slash);
}

} // namespace mediaflow::storage::common
