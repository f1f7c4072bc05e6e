#pragma once

#include <optional>
#include <string>

namespace relaystore::db::model {

/*
  Derived tag row. Fully regenerable from the owning event's content.

  Exactly one of value / value_hex is populated:
    value      raw string bytes, stored verbatim
    value_hex  bytes decoded from an even-length lowercase hex string
*/

struct TagRecord {
  std::string event_id;
  std::string name;

  std::optional<std::string> value;
  std::optional<std::string> value_hex;
};

}
