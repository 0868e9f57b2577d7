#include "internal/media/preview_generator.hpp"

#include <arrow/util/base64.h>

#include <string_view>

namespace mediaflow::media {

InlinePreviewGenerator::InlinePreviewGenerator(std::uint32_t max_bytes) : max_bytes_(max_bytes == 0 ? kDefaultMaxBytes : max_bytes) {
}

std::string InlinePreviewGenerator::Generate(const model::MediaPayload& payload, model::MediaKind kind) {
  if (kind != model::MediaKind::kImage || !payload.bytes || payload.size() == 0 || payload.size() > max_bytes_) {
    return {};
  }

  const std::string_view raw(reinterpret_cast<const char*>(payload.bytes->data()), static_cast<std::size_t>(payload.bytes->size()));
  const std::string      content_type = payload.content_type.empty() ? "application/octet-stream" : payload.content_type;
  return "data:" + content_type + ";base64," + arrow::util::base64_encode(raw);
}

} // namespace mediaflow::media
