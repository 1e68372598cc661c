#include <iostream>
#include <vector>

#include "bytepair/tokenizer.hpp"

int main() {
  using namespace bytepair;

  const std::string corpus =
      "Byte pair encoding merges the most frequent pair of adjacent symbols.\n"
      "Each merge becomes a new symbol, so frequent words end up as single tokens.\n"
      "Encoding replays the merges in the order they were learned.\n";

  TrainerOptions opts;
  opts.vocab_size = 300;
  opts.allow_early_stop = true;
  ByteLevelBPETokenizer tokenizer(opts);
  const auto stats = tokenizer.Train(corpus);
  std::cout << "Learned " << stats.merges << " merges, vocab size " << tokenizer.VocabSize() << '\n';

  const auto ids = tokenizer.Encode("frequent merges", EncodeOptions{true, true});
  std::cout << "Encoded IDs:";
  for (auto id : ids) {
    std::cout << ' ' << id;
  }
  std::cout << "\nDecoded: " << tokenizer.Decode(ids) << '\n';

  tokenizer.Save("example_tokenizer");
  const auto reloaded = ByteLevelBPETokenizer::Load("example_tokenizer");
  std::cout << "Reloaded decode: " << reloaded.Decode(reloaded.Encode("frequent merges")) << '\n';
  return 0;
}
