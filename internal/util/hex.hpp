#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace relaystore::util {

// true iff every character is in [0-9a-f]. The empty string qualifies.
bool IsLowerHex(std::string_view s);

// Lowercase hex of raw bytes.
std::string HexEncode(std::string_view bytes);

// Accepts upper or lower case; nullopt on odd length or a non-hex character.
std::optional<std::string> HexDecode(std::string_view hex);

} // namespace relaystore::util
