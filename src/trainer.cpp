#include "bytepair/trainer.hpp"

#include <iostream>
#include <memory>
#include <unordered_map>

#include "bytepair/errors.hpp"
#include "bytepair/progress.hpp"

namespace bytepair {

namespace {
std::vector<TokenId> ToByteIds(std::string_view bytes) {
  std::vector<TokenId> ids;
  ids.reserve(bytes.size());
  for (unsigned char c : bytes) {
    ids.push_back(c);
  }
  return ids;
}
}  // namespace

ByteLevelBPETrainer::ByteLevelBPETrainer(TrainerOptions options) : options_(options) {}

std::vector<ByteLevelBPETrainer::WordItem> ByteLevelBPETrainer::BuildInitialCorpus(std::string_view corpus) const {
  const auto chunks = pretokenizer_.Split(corpus);
  std::vector<WordItem> words;

  if (!options_.respect_chunk_boundaries) {
    std::string joined;
    joined.reserve(corpus.size());
    for (const auto chunk : chunks) {
      joined.append(chunk);
    }
    words.push_back(WordItem{ToByteIds(joined), 1});
    return words;
  }

  // Identical chunks collapse into one weighted item. Items keep the order of
  // their first occurrence, which keeps pair discovery order unchanged.
  std::unordered_map<std::string_view, std::size_t> index;
  for (const auto chunk : chunks) {
    auto [it, inserted] = index.try_emplace(chunk, words.size());
    if (inserted) {
      words.push_back(WordItem{ToByteIds(chunk), 1});
    } else {
      ++words[it->second].freq;
    }
  }
  return words;
}

PairCounts ByteLevelBPETrainer::CountCorpusPairs(const std::vector<WordItem>& words) const {
  PairCounts counts;
  for (const auto& word : words) {
    CountPairs(word.symbols, counts, word.freq);
  }
  return counts;
}

void ByteLevelBPETrainer::MergeCorpusPair(std::vector<WordItem>& words, TokenPair pair, TokenId new_id) const {
  for (auto& word : words) {
    MergePair(word.symbols, pair, new_id);
  }
}

TrainResult ByteLevelBPETrainer::Train(std::string_view corpus) const {
  TrainResult result{MakeBaseModel(options_.layout), {}};
  auto& model = result.model;
  auto& stats = result.stats;
  stats.requested_vocab_size = options_.vocab_size;
  stats.corpus_bytes = corpus.size();

  const TokenId first_merge_id = model.specials.FirstMergeId();
  const std::size_t num_merges = options_.vocab_size > first_merge_id ? options_.vocab_size - first_merge_id : 0;

  auto words = BuildInitialCorpus(corpus);

  std::unique_ptr<ProgressTracker> progress;
  if (options_.progress_interval_ms > 0) {
    progress = std::make_unique<ProgressTracker>(num_merges, "training", options_.progress_interval_ms, "merges");
  }

  for (std::size_t i = 0; i < num_merges; ++i) {
    const auto best = CountCorpusPairs(words).MostFrequent();
    if (!best) {
      stats.stopped_early = true;
      break;
    }
    const TokenId new_id = first_merge_id + static_cast<TokenId>(i);
    MergeCorpusPair(words, best->first, new_id);
    model.merges.Add(best->first, new_id);
    if (progress) {
      progress->Add(1);
    }
  }
  if (progress) {
    progress->Finish();
  }

  ExtendVocab(model.vocab, model.merges);
  stats.merges = model.merges.size();
  stats.achieved_vocab_size = model.vocab.size();
  for (const auto& word : words) {
    stats.final_tokens += word.symbols.size() * word.freq;
  }

  if (stats.stopped_early) {
    if (!options_.allow_early_stop) {
      throw InsufficientDataError(stats.requested_vocab_size, stats.achieved_vocab_size);
    }
    std::cerr << "warning: corpus ran out of pairs after " << stats.merges << " merges; vocab size "
              << stats.achieved_vocab_size << " of requested " << stats.requested_vocab_size << "\n";
  }
  return result;
}

TrainResult ByteLevelBPETrainer::TrainFromFiles(const std::vector<std::string>& files,
                                                const CorpusReadOptions& ropts) const {
  CorpusReader reader(ropts);
  const std::string corpus = reader.ReadCorpus(files);
  return Train(corpus);
}

}  // namespace bytepair
