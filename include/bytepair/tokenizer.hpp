#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "bytepair/trainer.hpp"
#include "bytepair/vocab.hpp"

namespace bytepair {

struct EncodeOptions {
  bool add_bos = false;
  bool add_eos = false;
};

struct DecodeOptions {
  bool skip_special_tokens = true;
};

// What model code consumes: text to ids and back.
class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  [[nodiscard]] virtual std::vector<TokenId> Encode(std::string_view text, EncodeOptions opts = {}) const = 0;
  [[nodiscard]] virtual std::string Decode(std::span<const TokenId> ids, DecodeOptions opts = {}) const = 0;

  [[nodiscard]] virtual std::size_t VocabSize() const = 0;
  [[nodiscard]] virtual std::string_view TokenById(TokenId id) const = 0;
};

// Byte-level BPE tokenizer. Train (or Load) builds the vocabulary and merge
// table once; afterwards every const member is safe to call concurrently.
class ByteLevelBPETokenizer final : public Tokenizer {
 public:
  explicit ByteLevelBPETokenizer(std::size_t vocab_size = 1024,
                                 SpecialTokenLayout layout = SpecialTokenLayout::kOverlapping);
  explicit ByteLevelBPETokenizer(TrainerOptions options);
  ByteLevelBPETokenizer(BpeModel model, TrainerOptions options);

  // Replaces the learned state. On InsufficientDataError the previous state
  // is kept.
  TrainStats Train(std::string_view corpus);
  TrainStats TrainFromFiles(const std::vector<std::string>& files, const CorpusReadOptions& ropts = {});

  [[nodiscard]] std::vector<TokenId> Encode(std::string_view text, EncodeOptions opts = {}) const override;
  [[nodiscard]] std::string Decode(std::span<const TokenId> ids, DecodeOptions opts = {}) const override;

  // BOS + ids + EOS.
  [[nodiscard]] std::vector<TokenId> AddSpecialTokens(std::span<const TokenId> ids) const;

  // Writes the "vocab", "merges" and "config" blobs into `directory`,
  // creating it if needed. Throws std::runtime_error on I/O failure.
  void Save(const std::string& directory) const;
  // Throws CorruptStateError if a blob is missing or inconsistent.
  [[nodiscard]] static ByteLevelBPETokenizer Load(const std::string& directory);

  [[nodiscard]] std::size_t VocabSize() const override { return model_.vocab.size(); }
  [[nodiscard]] std::string_view TokenById(TokenId id) const override;

  [[nodiscard]] std::size_t TargetVocabSize() const { return options_.vocab_size; }
  [[nodiscard]] const TrainerOptions& Options() const { return options_; }
  [[nodiscard]] const SpecialTokens& Specials() const { return model_.specials; }
  [[nodiscard]] const Vocab& GetVocab() const { return model_.vocab; }
  [[nodiscard]] const MergeTable& GetMerges() const { return model_.merges; }

 private:
  void ApplyMerges(std::vector<TokenId>& ids) const;

  TrainerOptions options_;
  BpeModel model_;
};

}  // namespace bytepair
