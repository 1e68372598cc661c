#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>

#include "bytepair/errors.hpp"
#include "bytepair/tokenizer.hpp"

using namespace bytepair;

namespace {
const char* kCorpus =
    "Tokenizers learn merges from frequent byte pairs. Frequent pairs become tokens,\n"
    "and tokens become longer tokens. Encoding replays the merges; decoding joins bytes.\n";

ByteLevelBPETokenizer TrainedOnScenario() {
  ByteLevelBPETokenizer tokenizer(261);
  tokenizer.Train("aaabaaab");
  return tokenizer;
}

void TestDecodeScenario() {
  const auto tokenizer = TrainedOnScenario();
  const std::vector<TokenId> ids = {260, 97, 98, 260, 97, 98};
  assert(tokenizer.Decode(ids) == "aaabaaab");
}

void TestEncodeReplaysTrainingMerges() {
  const auto tokenizer = TrainedOnScenario();
  const auto ids = tokenizer.Encode("aaabaaab");
  assert((ids == std::vector<TokenId>{260, 97, 98, 260, 97, 98}));
  assert((tokenizer.Encode("aaa") == std::vector<TokenId>{260, 97}));
  assert(tokenizer.Encode("").empty());
  assert((tokenizer.Encode("b") == std::vector<TokenId>{98}));
}

void TestEncodeUsesLowestMergeIdFirst() {
  ByteLevelBPETokenizer tokenizer(300);
  tokenizer.Train(kCorpus);
  const auto& merges = tokenizer.GetMerges();
  // Every adjacent pair left in an encoded sequence is unmergeable.
  const auto ids = tokenizer.Encode("Frequent tokens become longer.");
  for (std::size_t i = 0; i + 1 < ids.size(); ++i) {
    assert(!merges.Find({ids[i], ids[i + 1]}));
  }
}

void TestDeterminismAndRoundTrip() {
  ByteLevelBPETokenizer tokenizer(330);
  tokenizer.Train(kCorpus);
  const std::vector<std::string> samples = {
      "Encoding replays the merges",
      "completely unseen words: zyxwvut",
      "unicode h\xC3\xA9llo w\xC3\xB6rld \xE2\x9C\x93",
      "tabs\tand\r\nnewlines\n\n",
      "",
  };
  for (const auto& text : samples) {
    const auto first = tokenizer.Encode(text);
    const auto second = tokenizer.Encode(text);
    assert(first == second);
    assert(first.size() <= text.size());
    assert(tokenizer.Decode(first) == text);
  }
}

void TestSpecialByteCollisionLosesByte() {
  // Overlapping layout: byte 0x00 encodes to PAD and disappears on decode.
  const auto tokenizer = TrainedOnScenario();
  const std::string text("a\0b", 3);
  const auto ids = tokenizer.Encode(text);
  assert((ids == std::vector<TokenId>{97, 0, 98}));
  assert(tokenizer.Specials().pad() == 0);
  const auto decoded = tokenizer.Decode(ids);
  assert(decoded == "ab");
  assert(decoded != text);

  const auto control = tokenizer.Decode(tokenizer.Encode("\x01\x02\x03x"));
  assert(control == "x");
}

void TestDisjointLayoutKeepsEveryByte() {
  ByteLevelBPETokenizer tokenizer(261, SpecialTokenLayout::kDisjoint);
  tokenizer.Train("aaabaaab");
  const std::string text("a\0\x01\x02\x03" "aab", 8);
  const auto ids = tokenizer.Encode(text);
  assert((ids == std::vector<TokenId>{97, 0, 1, 2, 3, 260, 98}));
  assert(tokenizer.Decode(ids) == text);
}

void TestMergedSpecialBytesDecodeAsSpecialText() {
  // Once a merge absorbs byte 0x00, its expansion is built from vocab[0],
  // which holds "<PAD>" in the overlapping layout.
  const std::string corpus("\0\0\0\0\0\0" "abababab", 14);
  const std::string nuls("\0\0", 2);

  ByteLevelBPETokenizer overlapping(261);
  overlapping.Train(corpus);
  assert(overlapping.GetMerges().merges()[0].pair == TokenPair(0, 0));
  const auto ids = overlapping.Encode(nuls);
  assert((ids == std::vector<TokenId>{260}));
  assert(overlapping.Decode(ids) == "<PAD><PAD>");

  ByteLevelBPETokenizer disjoint(261, SpecialTokenLayout::kDisjoint);
  disjoint.Train(corpus);
  assert(disjoint.GetMerges().merges()[0].pair == TokenPair(0, 0));
  assert((disjoint.Encode(nuls) == std::vector<TokenId>{260}));
  assert(disjoint.Decode(disjoint.Encode(nuls)) == nuls);
}

void TestSpecialTokens() {
  const auto overlapping = TrainedOnScenario();
  const std::vector<TokenId> body = {97, 98};
  assert((overlapping.AddSpecialTokens(body) == std::vector<TokenId>{2, 97, 98, 3}));
  assert((overlapping.Encode("ab", EncodeOptions{true, true}) == std::vector<TokenId>{2, 97, 98, 3}));

  // Dropped wherever they occur, not only at the ends.
  const std::vector<TokenId> noisy = {2, 97, 0, 1, 98, 3};
  assert(overlapping.Decode(noisy) == "ab");
  assert(overlapping.Decode(std::vector<TokenId>{2, 97}, DecodeOptions{false}) == "<BOS>a");

  ByteLevelBPETokenizer disjoint(260, SpecialTokenLayout::kDisjoint);
  assert((disjoint.AddSpecialTokens(body) == std::vector<TokenId>{258, 97, 98, 259}));
  assert(disjoint.Decode(std::vector<TokenId>{258, 97, 256, 98, 259}) == "ab");
}

void TestDecodeIsTotal() {
  const auto tokenizer = TrainedOnScenario();
  // Invalid UTF-8 becomes U+FFFD.
  assert(tokenizer.Decode(std::vector<TokenId>{0xFF}) == "\xEF\xBF\xBD");
  assert(tokenizer.Decode(std::vector<TokenId>{97, 0xC3}) == "a\xEF\xBF\xBD");
  // Unknown ids and unassigned ids are skipped.
  assert(tokenizer.Decode(std::vector<TokenId>{97, 99999, 98}) == "ab");
  assert(tokenizer.Decode(std::vector<TokenId>{257}).empty());
  assert(tokenizer.TokenById(257).empty());
  assert(tokenizer.TokenById(260) == "aa");
}

void TestFailedTrainingKeepsState() {
  ByteLevelBPETokenizer tokenizer(262);
  tokenizer.Train("aaabaaab");
  const auto before = tokenizer.Encode("aaabaaab");
  bool thrown = false;
  try {
    tokenizer.Train("ab");
  } catch (const InsufficientDataError&) {
    thrown = true;
  }
  assert(thrown);
  assert(tokenizer.GetMerges().size() == 2);
  assert(tokenizer.Encode("aaabaaab") == before);
}

void TestUsableThroughInterface() {
  const auto concrete = TrainedOnScenario();
  const Tokenizer& tokenizer = concrete;
  const auto ids = tokenizer.Encode("aaab");
  assert(tokenizer.Decode(ids) == "aaab");
  assert(tokenizer.VocabSize() == 261);
}
}  // namespace

int main() {
  TestDecodeScenario();
  TestEncodeReplaysTrainingMerges();
  TestEncodeUsesLowestMergeIdFirst();
  TestDeterminismAndRoundTrip();
  TestSpecialByteCollisionLosesByte();
  TestDisjointLayoutKeepsEveryByte();
  TestMergedSpecialBytesDecodeAsSpecialText();
  TestSpecialTokens();
  TestDecodeIsTotal();
  TestFailedTrainingKeepsState();
  TestUsableThroughInterface();
  return 0;
}
