#include "destination_path.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace mediaflow::queue {

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool IsSafeExtension(const std::string& ext) {
  if (ext.empty() || ext.size() > 8) return false;
  return std::all_of(ext.begin(), ext.end(), [](unsigned char c) { return std::isalnum(c) != 0; });
}

} // namespace

std::string ExtensionFor(const model::MediaPayload& payload) {
  const auto dot = payload.filename.rfind('.');
  if (dot != std::string::npos && dot + 1 < payload.filename.size()) {
    auto ext = Lower(payload.filename.substr(dot + 1));
    if (IsSafeExtension(ext)) return ext;
  }

  static const std::unordered_map<std::string, std::string> kByContentType = {
      {"image/jpeg", "jpg"}, {"image/jpg", "jpg"},  {"image/png", "png"},       {"image/gif", "gif"},
      {"image/webp", "webp"}, {"image/heic", "heic"}, {"video/mp4", "mp4"},     {"video/quicktime", "mov"},
      {"video/webm", "webm"}, {"video/x-matroska", "mkv"},
  };

  auto content_type = Lower(payload.content_type);
  if (auto semi = content_type.find(';'); semi != std::string::npos) {
    content_type.resize(semi);
  }
  if (auto it = kByContentType.find(content_type); it != kByContentType.end()) {
    return it->second;
  }
  return "bin";
}

std::string PlaceholderFilename(const std::string& record_id, const model::MediaPayload& payload) {
  return "p_" + record_id + "." + ExtensionFor(payload);
}

std::string ExpandDestination(const std::string& path_template, const std::string& collection, const std::string& record_id,
                              const std::string& filename) {
  std::string out;
  out.reserve(path_template.size() + record_id.size() + filename.size());

  std::size_t pos = 0;
  while (pos < path_template.size()) {
    const auto open = path_template.find('{', pos);
    if (open == std::string::npos) {
      out.append(path_template, pos, std::string::npos);
      break;
    }
    out.append(path_template, pos, open - pos);

    const auto close = path_template.find('}', open);
    if (close == std::string::npos) {
      throw std::invalid_argument("unterminated placeholder in destination template: " + path_template);
    }

    const auto name = path_template.substr(open + 1, close - open - 1);
    if (name == "collection") {
      out += collection;
    } else if (name == "record_id") {
      out += record_id;
    } else if (name == "filename") {
      out += filename;
    } else {
      throw std::invalid_argument("unknown placeholder {" + name + "} in destination template");
    }
    pos = close + 1;
  }
  return out;
}

} // namespace mediaflow::queue
