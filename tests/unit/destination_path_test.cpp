#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/media/preview_generator.hpp"
#include "internal/queue/destination_path.hpp"

namespace {

using namespace mediaflow;

model::MediaPayload Payload(std::string filename, std::string content_type, std::string bytes = "abc") {
  return model::MediaPayload{.bytes = arrow::Buffer::FromString(std::move(bytes)), .content_type = std::move(content_type),
                             .filename = std::move(filename)};
}

bool ExpandThrows(const std::string& path_template) {
  try {
    queue::ExpandDestination(path_template, "posts", "r1", "p_r1.jpg");
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestExtension() {
  assert(queue::ExtensionFor(Payload("IMG_001.HEIC", "")) == "heic");
  assert(queue::ExtensionFor(Payload("archive.tar.gz", "")) == "gz");
  assert(queue::ExtensionFor(Payload("clip", "video/quicktime")) == "mov");
  assert(queue::ExtensionFor(Payload("trailing.", "image/PNG; q=1")) == "png");
  assert(queue::ExtensionFor(Payload("bad.ex-t", "image/webp")) == "webp");
  assert(queue::ExtensionFor(Payload("x.verylongext", "")) == "bin");
  assert(queue::ExtensionFor(Payload("", "application/pdf")) == "bin");
}

void TestPlaceholderFilename() {
  assert(queue::PlaceholderFilename("abc", Payload("a.JPG", "image/jpeg")) == "p_abc.jpg");
  assert(queue::PlaceholderFilename("abc", Payload("", "video/mp4")) == "p_abc.mp4");
}

void TestExpandDestination() {
  assert(queue::ExpandDestination(queue::kDefaultDestinationTemplate, "posts", "r1", "p_r1.jpg") == "posts/r1/p_r1.jpg");
  assert(queue::ExpandDestination("media/{record_id}-{filename}", "posts", "r1", "p_r1.jpg") == "media/r1-p_r1.jpg");
  assert(queue::ExpandDestination("static/name", "posts", "r1", "f") == "static/name");

  assert(ExpandThrows("{collection}/{user}/{filename}"));
  assert(ExpandThrows("{collection}/{record_id"));
}

void TestInlinePreview() {
  media::InlinePreviewGenerator generator(8);

  assert(generator.Generate(Payload("a.png", "image/png", "abc"), model::MediaKind::kImage) == "data:image/png;base64,YWJj");
  assert(generator.Generate(Payload("a", "", "abc"), model::MediaKind::kImage) == "data:application/octet-stream;base64,YWJj");
  assert(generator.Generate(Payload("a.png", "image/png", "123456789"), model::MediaKind::kImage).empty());
  assert(generator.Generate(Payload("a.mp4", "video/mp4", "abc"), model::MediaKind::kVideo).empty());
  assert(generator.Generate(model::MediaPayload{}, model::MediaKind::kImage).empty());
}

} // namespace

int main() {
  TestExtension();
  TestPlaceholderFilename();
  TestExpandDestination();
  TestInlinePreview();

  std::cout << "mediaflow_unit_destination_path: pass\n";
  return 0;
}
