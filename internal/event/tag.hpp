#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/tag_record.hpp"

namespace relaystore::event {

// A tag as it appears in event content: ["e", "<value>", ...].
using TagEntry = std::vector<std::string>;

/*
  Returns the tag name if it consists of exactly one character
  (one UTF-8 code point), nullopt otherwise. Only such tags are indexed.
*/
std::optional<std::string> SingleCharTagName(std::string_view name);

enum class TagValueEncoding {
  kRaw, // stored verbatim in tag.value
  kHex, // decoded into tag.value_hex
};

/*
  Losslessness test.

  A value is hex-packed only when decode-then-encode reproduces it exactly:
  even length and lowercase hex digits only. Anything else (uppercase, odd
  length, non-hex characters) is stored as is.
*/
TagValueEncoding ClassifyTagValue(std::string_view value);

// nullopt when the entry has fewer than two elements or an unindexable name.
std::optional<db::model::TagRecord> MakeTagRecord(const std::string& event_id, const TagEntry& entry);

/*
  Indexable tag rows for one event, in content order, with duplicate
  (name, value) pairs collapsed to the first occurrence.
*/
struct IndexedTags {
  std::vector<db::model::TagRecord> rows;
  std::size_t                       discarded = 0;
};

IndexedTags IndexTags(const std::string& event_id, const std::vector<TagEntry>& tags);

// Original string form of a stored tag value.
std::string TagValueString(const db::model::TagRecord& tag);

} // namespace relaystore::event
