#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>

#include "bytepair/errors.hpp"
#include "bytepair/trainer.hpp"

using namespace bytepair;

namespace {
const char* kParagraph =
    "The quick brown fox jumps over the lazy dog. The dog sleeps; the fox runs.\n"
    "Numbers like 1234567 and 42 appear too, and so do contractions: it's, we'll, they've.\n";

TrainerOptions Options(std::size_t vocab_size) {
  TrainerOptions opts;
  opts.vocab_size = vocab_size;
  return opts;
}

void TestSingleMergeScenario() {
  auto result = ByteLevelBPETrainer(Options(261)).Train("aaabaaab");
  const auto& model = result.model;
  assert(model.merges.size() == 1);
  assert(model.merges.merges()[0].pair == TokenPair(97, 97));
  assert(model.merges.merges()[0].id == 260);
  assert(*model.merges.Find({97, 97}) == 260);
  assert(model.vocab.size() == 261);
  assert(model.vocab[260] == "aa");
  // [260, 97, 98, 260, 97, 98]
  assert(result.stats.final_tokens == 6);
  assert(result.stats.achieved_vocab_size == 261);
  assert(!result.stats.stopped_early);
}

void TestMergeCountAndVocabConsistency() {
  auto result = ByteLevelBPETrainer(Options(320)).Train(kParagraph);
  const auto& model = result.model;
  assert(model.merges.size() == 320 - 256 - SpecialTokens::kCount);
  assert(model.vocab.size() == 320);

  TokenId expected_id = model.specials.FirstMergeId();
  for (const auto& merge : model.merges.merges()) {
    assert(merge.id == expected_id++);
    const auto& [a, b] = merge.pair;
    assert(a < merge.id && b < merge.id);
    assert(model.vocab[merge.id].size() == model.vocab[a].size() + model.vocab[b].size());
    assert(model.vocab[merge.id] == model.vocab[a] + model.vocab[b]);
  }
}

void TestTieGoesToFirstSeenPair() {
  // (a,b) and (c,d) both occur twice.
  auto first = ByteLevelBPETrainer(Options(261)).Train("ababcdcd");
  assert(first.model.merges.merges()[0].pair == TokenPair('a', 'b'));

  auto second = ByteLevelBPETrainer(Options(261)).Train("cdcdabab");
  assert(second.model.merges.merges()[0].pair == TokenPair('c', 'd'));
}

void TestTrainingIsDeterministic() {
  auto a = ByteLevelBPETrainer(Options(300)).Train(kParagraph);
  auto b = ByteLevelBPETrainer(Options(300)).Train(kParagraph);
  assert(a.model.vocab == b.model.vocab);
  assert(a.model.merges.size() == b.model.merges.size());
  for (std::size_t i = 0; i < a.model.merges.size(); ++i) {
    assert(a.model.merges.merges()[i].pair == b.model.merges.merges()[i].pair);
  }
}

void TestInsufficientDataThrows() {
  bool thrown = false;
  try {
    (void)ByteLevelBPETrainer(Options(262)).Train("ab");
  } catch (const InsufficientDataError& e) {
    thrown = true;
    assert(e.requested_vocab_size() == 262);
    assert(e.achieved_vocab_size() == 261);
  }
  assert(thrown);

  thrown = false;
  try {
    (void)ByteLevelBPETrainer(Options(261)).Train("");
  } catch (const InsufficientDataError& e) {
    thrown = true;
    assert(e.achieved_vocab_size() == 260);
  }
  assert(thrown);
}

void TestEarlyStopKeepsPartialVocab() {
  auto opts = Options(262);
  opts.allow_early_stop = true;
  auto result = ByteLevelBPETrainer(opts).Train("ab");
  assert(result.stats.stopped_early);
  assert(result.stats.merges == 1);
  assert(result.stats.achieved_vocab_size == 261);
  assert(result.model.vocab[260] == "ab");
}

void TestNoMergesRequested() {
  auto result = ByteLevelBPETrainer(Options(200)).Train("");
  assert(result.model.merges.empty());
  assert(result.model.vocab.size() == 260);
  assert(!result.stats.stopped_early);
}

void TestChunkBoundaries() {
  // Chunks: "ab", " ab", " ab".
  auto joined = ByteLevelBPETrainer(Options(263)).Train("ab ab ab");
  const auto& jm = joined.model.merges.merges();
  assert(jm.size() == 3);
  assert(jm[0].pair == TokenPair('a', 'b'));
  // 'b' ends one chunk and ' ' starts the next.
  assert(jm[1].pair == TokenPair(260, ' '));

  auto opts = Options(262);
  opts.respect_chunk_boundaries = true;
  auto split = ByteLevelBPETrainer(opts).Train("ab ab ab");
  const auto& sm = split.model.merges.merges();
  assert(sm.size() == 2);
  assert(sm[0].pair == TokenPair('a', 'b'));
  assert(sm[1].pair == TokenPair(' ', 260));
  assert(split.model.vocab[261] == " ab");
  // "ab" x1 and " ab" x2 are single tokens now.
  assert(split.stats.final_tokens == 3);

  opts.vocab_size = 263;
  bool thrown = false;
  try {
    (void)ByteLevelBPETrainer(opts).Train("ab ab ab");
  } catch (const InsufficientDataError&) {
    thrown = true;
  }
  assert(thrown);
}

void TestDisjointLayoutNumbering() {
  auto opts = Options(261);
  opts.layout = SpecialTokenLayout::kDisjoint;
  auto result = ByteLevelBPETrainer(opts).Train("aaabaaab");
  assert(result.model.merges.merges()[0].id == 260);
  assert(result.model.vocab[0] == std::string(1, '\0'));
  assert(result.model.vocab[256] == "<PAD>");
  assert(result.model.vocab[259] == "<EOS>");
}
}  // namespace

int main() {
  TestSingleMergeScenario();
  TestMergeCountAndVocabConsistency();
  TestTieGoesToFirstSeenPair();
  TestTrainingIsDeterministic();
  TestInsufficientDataThrows();
  TestEarlyStopKeepsPartialVocab();
  TestNoMergesRequested();
  TestChunkBoundaries();
  TestDisjointLayoutNumbering();
  return 0;
}
