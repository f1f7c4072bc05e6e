#include "internal/util/hex.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using relaystore::util::HexDecode;
using relaystore::util::HexEncode;
using relaystore::util::IsLowerHex;

void TestIsLowerHex() {
  assert(IsLowerHex("deadbeef"));
  assert(IsLowerHex("0123456789abcdef"));
  assert(IsLowerHex(""));
  assert(!IsLowerHex("DeadBeef"));
  assert(!IsLowerHex("abcg"));
  assert(!IsLowerHex("ab cd"));
}

void TestDecodeEncode() {
  auto bytes = HexDecode("deadbeef");
  assert(bytes.has_value());
  assert(bytes->size() == 4);
  assert(static_cast<unsigned char>((*bytes)[0]) == 0xde);
  assert(static_cast<unsigned char>((*bytes)[3]) == 0xef);
  assert(HexEncode(*bytes) == "deadbeef");

  // decodes, but does not re-encode to the same text
  auto upper = HexDecode("DEADBEEF");
  assert(upper.has_value());
  assert(HexEncode(*upper) == "deadbeef");
}

void TestDecodeRejectsInvalidInput() {
  assert(!HexDecode("abc").has_value());
  assert(!HexDecode("zz").has_value());

  auto empty = HexDecode("");
  assert(empty.has_value() && empty->empty());
}

void TestEncodeBinary() {
  std::string bytes{'\x00', '\x7f', '\x80', '\xff'};
  assert(HexEncode(bytes) == "007f80ff");
}

} // namespace

int main() {
  TestIsLowerHex();
  TestDecodeEncode();
  TestDecodeRejectsInvalidInput();
  TestEncodeBinary();

  std::cout << "relaystore_unit_hex: pass\n";
  return 0;
}
