#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bytepair {

// Reads one code point starting at `i` and advances `i`. Malformed or
// truncated sequences consume a single byte and yield U+FFFD.
bool NextCodepoint(std::string_view s, std::size_t& i, std::uint32_t& cp);

void AppendUtf8(std::uint32_t cp, std::string& out);

// GPT-2 printable alphabet: every byte maps to one visible code point.
[[nodiscard]] const std::array<std::uint32_t, 256>& ByteToUnicode();

[[nodiscard]] std::string ByteLevelEncode(std::string_view bytes);

// Inverse of ByteLevelEncode. Returns nullopt if `text` contains a code point
// outside the byte-level alphabet.
[[nodiscard]] std::optional<std::string> ByteLevelDecode(std::string_view text);

// Decodes `bytes` as UTF-8, substituting U+FFFD for every maximal invalid
// subsequence. The result is always valid UTF-8.
[[nodiscard]] std::string Utf8Lossy(std::string_view bytes);

// Utf8Lossy over pieces of at most `max_chunk` bytes (clamped to the ICU
// int32_t length limit), cut only at code point starts.
[[nodiscard]] std::string Utf8LossyChunked(std::string_view bytes, std::size_t max_chunk);

}  // namespace bytepair
