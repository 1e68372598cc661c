#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "bytepair/corpus_reader.hpp"
#include "bytepair/pair_counter.hpp"
#include "bytepair/pretokenizer.hpp"
#include "bytepair/vocab.hpp"

namespace bytepair {

struct TrainerOptions {
  // Target size of the id space: 256 bytes + specials + merges.
  std::size_t vocab_size = 1024;
  SpecialTokenLayout layout = SpecialTokenLayout::kOverlapping;
  // When false, pretokenized chunks are joined back into one byte stream and
  // pairs may span chunk boundaries.
  bool respect_chunk_boundaries = false;
  // When false, running out of pairs throws InsufficientDataError.
  bool allow_early_stop = false;
  // 0 disables progress output.
  std::size_t progress_interval_ms = 0;
};

struct TrainStats {
  std::size_t requested_vocab_size = 0;
  std::size_t achieved_vocab_size = 0;
  std::size_t merges = 0;
  std::size_t corpus_bytes = 0;
  std::size_t final_tokens = 0;
  bool stopped_early = false;
};

struct TrainResult {
  BpeModel model;
  TrainStats stats;
};

class ByteLevelBPETrainer {
 public:
  explicit ByteLevelBPETrainer(TrainerOptions options = {});

  // Throws InsufficientDataError when the corpus supports fewer merges than
  // requested and allow_early_stop is off.
  [[nodiscard]] TrainResult Train(std::string_view corpus) const;
  [[nodiscard]] TrainResult TrainFromFiles(const std::vector<std::string>& files,
                                           const CorpusReadOptions& ropts = {}) const;

  [[nodiscard]] const TrainerOptions& options() const { return options_; }

 private:
  // A distinct byte sequence and how many times it occurs in the corpus.
  struct WordItem {
    std::vector<TokenId> symbols;
    std::uint64_t freq = 1;
  };

  [[nodiscard]] std::vector<WordItem> BuildInitialCorpus(std::string_view corpus) const;
  [[nodiscard]] PairCounts CountCorpusPairs(const std::vector<WordItem>& words) const;
  void MergeCorpusPair(std::vector<WordItem>& words, TokenPair pair, TokenId new_id) const;

  TrainerOptions options_;
  Pretokenizer pretokenizer_;
};

}  // namespace bytepair
