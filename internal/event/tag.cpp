#include "internal/event/tag.hpp"

#include <set>
#include <tuple>

#include "internal/util/hex.hpp"

namespace relaystore::event {
namespace {

// Length of the UTF-8 sequence introduced by a lead byte, 0 if not a lead byte.
std::size_t Utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 0;
}

} // namespace

std::optional<std::string> SingleCharTagName(std::string_view name) {
  if (name.empty()) {
    return std::nullopt;
  }
  std::size_t len = Utf8SequenceLength(static_cast<unsigned char>(name.front()));
  if (len == 0 || len != name.size()) {
    return std::nullopt;
  }
  for (std::size_t i = 1; i < len; ++i) {
    if ((static_cast<unsigned char>(name[i]) & 0xC0) != 0x80) {
      return std::nullopt;
    }
  }
  return std::string(name);
}

TagValueEncoding ClassifyTagValue(std::string_view value) {
  if (value.size() % 2 == 0 && util::IsLowerHex(value)) {
    return TagValueEncoding::kHex;
  }
  return TagValueEncoding::kRaw;
}

std::optional<db::model::TagRecord> MakeTagRecord(const std::string& event_id, const TagEntry& entry) {
  if (entry.size() < 2) {
    return std::nullopt;
  }

  auto name = SingleCharTagName(entry[0]);
  if (!name) {
    return std::nullopt;
  }

  db::model::TagRecord tag;
  tag.event_id = event_id;
  tag.name     = std::move(*name);

  const auto& value = entry[1];
  if (ClassifyTagValue(value) == TagValueEncoding::kHex) {
    // cannot fail: even length and hex digits were just checked
    tag.value_hex = util::HexDecode(value).value_or(std::string{});
  } else {
    tag.value = value;
  }
  return tag;
}

IndexedTags IndexTags(const std::string& event_id, const std::vector<TagEntry>& tags) {
  IndexedTags out;
  std::set<std::tuple<std::string, bool, std::string>> seen;

  for (const auto& entry : tags) {
    auto tag = MakeTagRecord(event_id, entry);
    if (!tag) {
      ++out.discarded;
      continue;
    }

    bool hex = tag->value_hex.has_value();
    auto key = std::make_tuple(tag->name, hex, hex ? *tag->value_hex : *tag->value);
    if (!seen.insert(std::move(key)).second) {
      continue;
    }
    out.rows.push_back(std::move(*tag));
  }
  return out;
}

std::string TagValueString(const db::model::TagRecord& tag) {
  if (tag.value_hex) {
    return util::HexEncode(*tag.value_hex);
  }
  return tag.value.value_or(std::string{});
}

} // namespace relaystore::event
