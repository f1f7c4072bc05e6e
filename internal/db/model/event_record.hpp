#pragma once

#include <cstdint>
#include <string>

namespace relaystore::db::model {

/*
  Persistent event row.

  Byte columns are carried as std::string holding raw bytes
  (not hex). id is the content hash, fixed length.
*/

struct EventRecord {
  std::string id;
  std::string pub_key;

  // unix seconds
  int64_t created_at = 0;
  int32_t kind       = 0;

  // stored JSON document (raw bytes)
  std::string content;

  bool        hidden = false;
  std::string delegated_by; // empty = none
};

}
