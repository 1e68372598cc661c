#include "bytepair/tokenizer.hpp"

#include <limits>
#include <utility>

#include "bytepair/byte_level.hpp"
#include "bytepair/pair_counter.hpp"
#include "bytepair/serialization.hpp"

namespace bytepair {

ByteLevelBPETokenizer::ByteLevelBPETokenizer(std::size_t vocab_size, SpecialTokenLayout layout)
    : ByteLevelBPETokenizer(TrainerOptions{vocab_size, layout}) {}

ByteLevelBPETokenizer::ByteLevelBPETokenizer(TrainerOptions options)
    : options_(options), model_(MakeBaseModel(options.layout)) {}

ByteLevelBPETokenizer::ByteLevelBPETokenizer(BpeModel model, TrainerOptions options)
    : options_(options), model_(std::move(model)) {
  options_.layout = model_.specials.layout();
}

TrainStats ByteLevelBPETokenizer::Train(std::string_view corpus) {
  auto result = ByteLevelBPETrainer(options_).Train(corpus);
  model_ = std::move(result.model);
  return result.stats;
}

TrainStats ByteLevelBPETokenizer::TrainFromFiles(const std::vector<std::string>& files,
                                                 const CorpusReadOptions& ropts) {
  auto result = ByteLevelBPETrainer(options_).TrainFromFiles(files, ropts);
  model_ = std::move(result.model);
  return result.stats;
}

void ByteLevelBPETokenizer::ApplyMerges(std::vector<TokenId>& ids) const {
  if (model_.merges.empty()) {
    return;
  }
  while (ids.size() > 1) {
    TokenId best_id = std::numeric_limits<TokenId>::max();
    TokenPair best_pair{};
    bool found = false;
    for (std::size_t i = 0; i + 1 < ids.size(); ++i) {
      const TokenPair pair{ids[i], ids[i + 1]};
      auto id = model_.merges.Find(pair);
      if (id && *id < best_id) {
        best_id = *id;
        best_pair = pair;
        found = true;
      }
    }
    if (!found) {
      break;
    }
    MergePair(ids, best_pair, best_id);
  }
}

std::vector<TokenId> ByteLevelBPETokenizer::Encode(std::string_view text, EncodeOptions opts) const {
  std::vector<TokenId> ids;
  ids.reserve(text.size() + 2);
  for (unsigned char c : text) {
    ids.push_back(c);
  }
  ApplyMerges(ids);

  if (opts.add_bos) {
    ids.insert(ids.begin(), model_.specials.bos());
  }
  if (opts.add_eos) {
    ids.push_back(model_.specials.eos());
  }
  return ids;
}

std::string ByteLevelBPETokenizer::Decode(std::span<const TokenId> ids, DecodeOptions opts) const {
  std::string bytes;
  for (TokenId id : ids) {
    if (opts.skip_special_tokens && model_.specials.Contains(id)) {
      continue;
    }
    if (id >= model_.vocab.size()) {
      continue;
    }
    bytes += model_.vocab[id];
  }
  return Utf8Lossy(bytes);
}

std::vector<TokenId> ByteLevelBPETokenizer::AddSpecialTokens(std::span<const TokenId> ids) const {
  std::vector<TokenId> out;
  out.reserve(ids.size() + 2);
  out.push_back(model_.specials.bos());
  out.insert(out.end(), ids.begin(), ids.end());
  out.push_back(model_.specials.eos());
  return out;
}

void ByteLevelBPETokenizer::Save(const std::string& directory) const {
  SaveTokenizerState(model_, options_, directory);
}

ByteLevelBPETokenizer ByteLevelBPETokenizer::Load(const std::string& directory) {
  auto state = LoadTokenizerState(directory);
  return ByteLevelBPETokenizer(std::move(state.model), state.options);
}

std::string_view ByteLevelBPETokenizer::TokenById(TokenId id) const {
  if (id >= model_.vocab.size()) {
    return {};
  }
  return model_.vocab[id];
}

}  // namespace bytepair
