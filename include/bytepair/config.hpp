#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "bytepair/trainer.hpp"
#include "bytepair/vocab.hpp"

namespace bytepair {

// Settings of the command line tools. Defaults, then a .env file, then flags.
struct Config {
  std::string env_path = ".env";
  std::vector<std::string> data_files;
  std::string text_field = "text";
  std::string output_dir = "tokenizer";
  std::string tokenizer_dir = "tokenizer";
  std::size_t vocab_size = 1024;
  SpecialTokenLayout layout = SpecialTokenLayout::kOverlapping;
  bool respect_chunk_boundaries = false;
  bool allow_early_stop = false;
  std::size_t progress_interval_ms = 1000;
};

// KEY=VALUE lines; blank lines and # comments are skipped, surrounding quotes
// are stripped. A missing file yields an empty map.
[[nodiscard]] std::unordered_map<std::string, std::string> ReadEnvFile(const std::string& path);

// Recognized keys: DATA_PATH (comma separated), TEXT_FIELD, OUTPUT_DIR,
// TOKENIZER_DIR, VOCAB_SIZE, LAYOUT, RESPECT_BOUNDARIES, ALLOW_EARLY_STOP,
// PROGRESS_INTERVAL_MS. Throws std::invalid_argument on a malformed value.
void ApplyEnvOverrides(Config& cfg, const std::unordered_map<std::string, std::string>& env);

// Finds "--env <path>" ahead of full argument parsing.
[[nodiscard]] std::string DetectEnvPathArg(int argc, char** argv, const std::string& default_path = ".env");

[[nodiscard]] std::size_t ParseSize(const std::string& key, const std::string& value);
[[nodiscard]] bool ParseBool(const std::string& key, const std::string& value);
// Like ParseSize, but rejects values that do not fit a TokenId.
[[nodiscard]] TokenId ParseTokenId(const std::string& key, const std::string& value);

[[nodiscard]] TrainerOptions MakeTrainerOptions(const Config& cfg);

}  // namespace bytepair
