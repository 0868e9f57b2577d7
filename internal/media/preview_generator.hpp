#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/model/media.hpp"

namespace mediaflow::media {

/*
  Derives the lightweight preview stored on the placeholder record while
  the real upload is in flight. Codec work (thumbnails, transcodes) lives
  behind this interface; the pipeline treats the result as an opaque string.

  Must not block on the network. An empty string means "no preview".
*/
class PreviewGenerator {
 public:
  virtual ~PreviewGenerator() = default;

  virtual std::string Generate(const model::MediaPayload& payload, model::MediaKind kind) = 0;
};

using PreviewGeneratorPtr = std::shared_ptr<PreviewGenerator>;

/*
  Inlines small images as a data: URI. Videos and images larger than
  max_bytes get no preview.
*/
class InlinePreviewGenerator final : public PreviewGenerator {
 public:
  static constexpr std::uint32_t kDefaultMaxBytes = 64 * 1024;

  explicit InlinePreviewGenerator(std::uint32_t max_bytes = kDefaultMaxBytes);

  std::string Generate(const model::MediaPayload& payload, model::MediaKind kind) override;

 private:
  std::uint32_t max_bytes_;
};

} // namespace mediaflow::media
