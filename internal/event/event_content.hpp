#pragma once

#include <string_view>
#include <vector>

#include "internal/event/tag.hpp"

namespace relaystore::event {

/*
  Extracts the "tags" member of a stored event document.

  The document must be a JSON object whose "tags" member is an array of
  arrays of strings. Other members are ignored. Throws util::MalformedEvent
  on anything else.
*/
std::vector<TagEntry> ParseTags(std::string_view content);

} // namespace relaystore::event
