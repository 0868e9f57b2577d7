#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <arrow/buffer.h>

namespace mediaflow::model {

enum class MediaKind : std::uint8_t {
  kImage = 0,
  kVideo = 1,
};

constexpr std::string_view ToString(MediaKind kind) {
  return kind == MediaKind::kVideo ? "video" : "image";
}

/*
  Bytes handed to the pipeline plus what the storage backend needs to
  label them. The buffer is shared between the queued task, the preview
  generator and the backend transfer; nobody mutates it.
*/
struct MediaPayload {
  std::shared_ptr<arrow::Buffer> bytes;
  std::string                    content_type;
  std::string                    filename;

  std::uint64_t size() const {
    return bytes ? static_cast<std::uint64_t>(bytes->size()) : 0;
  }
};

} // namespace mediaflow::model
