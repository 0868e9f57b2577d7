#pragma once

#include <string>

#include "internal/model/media.hpp"

namespace mediaflow::queue {

constexpr const char* kDefaultDestinationTemplate = "{collection}/{record_id}/{filename}";

// File extension for the stored object: the payload filename's extension,
// else one derived from the content type, else "bin".
std::string ExtensionFor(const model::MediaPayload& payload);

// "p_<record_id>.<ext>"
std::string PlaceholderFilename(const std::string& record_id, const model::MediaPayload& payload);

/*
  Expand {collection}, {record_id} and {filename}. Unknown placeholders
  throw std::invalid_argument.
*/
std::string ExpandDestination(const std::string& path_template, const std::string& collection, const std::string& record_id,
                              const std::string& filename);

} // namespace mediaflow::queue
