#undef NDEBUG
#include <cassert>
#include <cstddef>
#include <string>

#include "bytepair/byte_level.hpp"

using namespace bytepair;

namespace {
void TestByteLevelAlphabet() {
  const auto& map = ByteToUnicode();
  assert(map['A'] == 'A');
  assert(map[' '] == 0x120);
  assert(map['\n'] == 0x10A);
  std::string all;
  for (int b = 0; b < 256; ++b) {
    all.push_back(static_cast<char>(b));
  }
  const auto decoded = ByteLevelDecode(ByteLevelEncode(all));
  assert(decoded && *decoded == all);
  assert(ByteLevelEncode(" hi") == "\xC4\xA0hi");
  assert(!ByteLevelDecode("\xE2\x82\xAC"));
}

void TestUtf8Lossy() {
  assert(Utf8Lossy("caf\xC3\xA9") == "caf\xC3\xA9");
  assert(Utf8Lossy("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
  assert(Utf8Lossy("\xE2\x82") == "\xEF\xBF\xBD");
  assert(Utf8Lossy(std::string("a\0b", 3)) == std::string("a\0b", 3));
}

void TestChunkedDecodeMatchesWhole() {
  // Multi-byte sequences, truncated sequences and stray continuation bytes,
  // cut at every chunk size.
  const std::string input =
      "h\xC3\xA9llo \xF0\x9F\x98\x80 w\xE2\x82\xAC"
      "\xE2\x82 x\x80\x80\x80\x80\x80 \xF0\x9F\x98\x80\x80 end\xC3";
  const std::string whole = Utf8Lossy(input);
  for (std::size_t chunk = 1; chunk <= input.size() + 1; ++chunk) {
    assert(Utf8LossyChunked(input, chunk) == whole);
  }
  assert(Utf8LossyChunked("", 8).empty());
}
}  // namespace

int main() {
  TestByteLevelAlphabet();
  TestUtf8Lossy();
  TestChunkedDecodeMatchesWhole();
  return 0;
}
