#include "internal/event/event_content.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <string>

#include "internal/util/errors.hpp"

namespace relaystore::event {

using google::protobuf::Value;

std::vector<TagEntry> ParseTags(std::string_view content) {
  google::protobuf::Struct document;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(content), &document, options);
  if (!status.ok()) {
    throw util::MalformedEvent("event content is not a JSON object: " + std::string(status.message()));
  }

  const auto& fields = document.fields();
  auto        it     = fields.find("tags");
  if (it == fields.end()) {
    throw util::MalformedEvent("event content has no tags member");
  }
  if (it->second.kind_case() != Value::kListValue) {
    throw util::MalformedEvent("event tags member is not an array");
  }

  std::vector<TagEntry> tags;
  tags.reserve(it->second.list_value().values_size());

  for (const auto& tag_value : it->second.list_value().values()) {
    if (tag_value.kind_case() != Value::kListValue) {
      throw util::MalformedEvent("event tag is not an array");
    }

    TagEntry entry;
    entry.reserve(tag_value.list_value().values_size());
    for (const auto& element : tag_value.list_value().values()) {
      if (element.kind_case() != Value::kStringValue) {
        throw util::MalformedEvent("event tag element is not a string");
      }
      entry.push_back(element.string_value());
    }
    tags.push_back(std::move(entry));
  }

  return tags;
}

} // namespace relaystore::event
