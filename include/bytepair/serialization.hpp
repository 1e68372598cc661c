#pragma once

#include <string>
#include <string_view>

#include "bytepair/trainer.hpp"
#include "bytepair/vocab.hpp"

namespace bytepair {

// Blob names inside a saved tokenizer directory.
inline constexpr std::string_view kVocabBlob = "vocab";
inline constexpr std::string_view kMergesBlob = "merges";
inline constexpr std::string_view kConfigBlob = "config";

inline constexpr int kFormatVersion = 1;

struct SavedTokenizer {
  BpeModel model;
  TrainerOptions options;
};

// vocab:  JSON array, entry i is the byte-level rendering of id i (null for
//         ids without an expansion).
// merges: "#version" header, then "left right merged" per line in creation
//         order.
// config: JSON object with vocab_size, layout, respect_chunk_boundaries and
//         the special token ids.
void SaveTokenizerState(const BpeModel& model, const TrainerOptions& options, const std::string& directory);

// Validates every blob before returning; throws CorruptStateError.
[[nodiscard]] SavedTokenizer LoadTokenizerState(const std::string& directory);

}  // namespace bytepair
