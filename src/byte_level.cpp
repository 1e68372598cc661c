#include "bytepair/byte_level.hpp"

#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

#include <algorithm>
#include <limits>
#include <vector>

namespace bytepair {

namespace {
constexpr std::uint32_t kReplacementChar = 0xFFFD;

std::array<std::uint32_t, 256> BuildByteToUnicode() {
  std::vector<int> bs;
  bs.reserve(256);
  std::array<bool, 256> present{};
  for (int b = 33; b <= 126; ++b) {
    bs.push_back(b);
    present[b] = true;
  }
  for (int b = 161; b <= 172; ++b) {
    bs.push_back(b);
    present[b] = true;
  }
  for (int b = 174; b <= 255; ++b) {
    bs.push_back(b);
    present[b] = true;
  }
  std::vector<int> cs = bs;
  int n = 0;
  for (int b = 0; b < 256; ++b) {
    if (!present[b]) {
      bs.push_back(b);
      cs.push_back(256 + n);
      ++n;
    }
  }
  std::array<std::uint32_t, 256> map{};
  for (std::size_t i = 0; i < bs.size(); ++i) {
    map[static_cast<std::size_t>(bs[i])] = static_cast<std::uint32_t>(cs[i]);
  }
  return map;
}

// Byte-level code points all lie below 324; -1 marks a hole.
std::array<int, 324> BuildUnicodeToByte() {
  std::array<int, 324> inverse;
  inverse.fill(-1);
  const auto& forward = ByteToUnicode();
  for (std::size_t b = 0; b < forward.size(); ++b) {
    inverse[forward[b]] = static_cast<int>(b);
  }
  return inverse;
}

bool IsContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

std::size_t SequenceLength(unsigned char lead) {
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 1;
}
}  // namespace

bool NextCodepoint(std::string_view s, std::size_t& i, std::uint32_t& cp) {
  if (i >= s.size()) {
    return false;
  }
  const auto c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) {
    cp = c;
    i += 1;
    return true;
  }
  std::size_t len = 0;
  std::uint32_t value = 0;
  if ((c >> 5) == 0x6) {
    len = 2;
    value = c & 0x1F;
  } else if ((c >> 4) == 0xE) {
    len = 3;
    value = c & 0x0F;
  } else if ((c >> 3) == 0x1E) {
    len = 4;
    value = c & 0x07;
  }
  if (len == 0 || i + len > s.size()) {
    cp = kReplacementChar;
    i += 1;
    return true;
  }
  for (std::size_t k = 1; k < len; ++k) {
    const auto cc = static_cast<unsigned char>(s[i + k]);
    if (!IsContinuation(cc)) {
      cp = kReplacementChar;
      i += 1;
      return true;
    }
    value = (value << 6) | (cc & 0x3F);
  }
  cp = value;
  i += len;
  return true;
}

void AppendUtf8(std::uint32_t cp, std::string& out) {
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

const std::array<std::uint32_t, 256>& ByteToUnicode() {
  static const std::array<std::uint32_t, 256> map = BuildByteToUnicode();
  return map;
}

std::string ByteLevelEncode(std::string_view bytes) {
  const auto& map = ByteToUnicode();
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char b : bytes) {
    AppendUtf8(map[b], out);
  }
  return out;
}

std::optional<std::string> ByteLevelDecode(std::string_view text) {
  static const std::array<int, 324> inverse = BuildUnicodeToByte();
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  std::uint32_t cp = 0;
  while (NextCodepoint(text, i, cp)) {
    if (cp >= inverse.size() || inverse[cp] < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>(inverse[cp]));
  }
  return out;
}

std::string Utf8Lossy(std::string_view bytes) {
  return Utf8LossyChunked(bytes, static_cast<std::size_t>(std::numeric_limits<int32_t>::max()));
}

std::string Utf8LossyChunked(std::string_view bytes, std::size_t max_chunk) {
  // StringPiece lengths are int32_t.
  max_chunk = std::min<std::size_t>(std::max<std::size_t>(max_chunk, 4),
                                    static_cast<std::size_t>(std::numeric_limits<int32_t>::max()));
  std::string out;
  out.reserve(bytes.size());
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    std::size_t len = std::min(max_chunk, bytes.size() - pos);
    // Move the cut back to the lead byte of a sequence it would split.
    if (pos + len < bytes.size()) {
      for (std::size_t k = 1; k <= 3 && k < len; ++k) {
        const auto c = static_cast<unsigned char>(bytes[pos + len - k]);
        if (IsContinuation(c)) {
          continue;
        }
        if (SequenceLength(c) > k) {
          len -= k;
        }
        break;
      }
    }
    const auto ustr = icu::UnicodeString::fromUTF8(icu::StringPiece(bytes.data() + pos, static_cast<int32_t>(len)));
    ustr.toUTF8String(out);
    pos += len;
  }
  return out;
}

}  // namespace bytepair
