#include "bytepair/serialization.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "bytepair/byte_level.hpp"
#include "bytepair/errors.hpp"

namespace bytepair {

namespace {
namespace fs = std::filesystem;

constexpr std::string_view kMergesHeader = "#version: bytepair 1";

void WriteBlob(const fs::path& path, const std::string& payload) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to create " + path.string());
  }
  out << payload;
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write " + path.string());
  }
}

std::string ReadBlob(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw CorruptStateError("missing tokenizer blob: " + path.string());
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  if (in.bad()) {
    throw CorruptStateError("failed to read tokenizer blob: " + path.string());
  }
  return oss.str();
}

nlohmann::json ParseJsonBlob(const fs::path& path) {
  auto j = nlohmann::json::parse(ReadBlob(path), nullptr, false);
  if (j.is_discarded()) {
    throw CorruptStateError("malformed JSON in " + path.string());
  }
  return j;
}

nlohmann::json SpecialsToJson(const SpecialTokens& specials) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& token : specials.all()) {
    j[std::string(token.text)] = token.id;
  }
  return j;
}

TrainerOptions ParseConfig(const nlohmann::json& j, SpecialTokenLayout& layout) {
  if (!j.is_object()) {
    throw CorruptStateError("config blob is not an object");
  }
  TrainerOptions options;
  try {
    const int version = j.at("format_version").get<int>();
    if (version != kFormatVersion) {
      throw CorruptStateError("unsupported tokenizer format version " + std::to_string(version));
    }
    options.vocab_size = j.at("vocab_size").get<std::size_t>();
    options.respect_chunk_boundaries = j.at("respect_chunk_boundaries").get<bool>();
    layout = ParseLayout(j.at("layout").get<std::string>());
    options.layout = layout;
    if (j.at("special_tokens") != SpecialsToJson(SpecialTokens(layout))) {
      throw CorruptStateError("special tokens do not match layout " + std::string(LayoutName(layout)));
    }
  } catch (const nlohmann::json::exception& e) {
    throw CorruptStateError(std::string("malformed config blob: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw CorruptStateError(std::string("malformed config blob: ") + e.what());
  }
  return options;
}

Vocab ParseVocab(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw CorruptStateError("vocab blob is not an array");
  }
  Vocab vocab;
  vocab.reserve(j.size());
  for (const auto& entry : j) {
    if (entry.is_null()) {
      vocab.emplace_back();
      continue;
    }
    if (!entry.is_string()) {
      throw CorruptStateError("vocab entry " + std::to_string(vocab.size()) + " is not a string");
    }
    auto bytes = ByteLevelDecode(entry.get<std::string>());
    if (!bytes || bytes->empty()) {
      throw CorruptStateError("vocab entry " + std::to_string(vocab.size()) + " is not byte-level encoded");
    }
    vocab.push_back(std::move(*bytes));
  }
  return vocab;
}

MergeTable ParseMerges(const std::string& payload, const SpecialTokens& specials, const Vocab& base) {
  MergeTable merges;
  std::istringstream iss(payload);
  std::string line;
  TokenId next_id = specials.FirstMergeId();
  bool header_seen = false;
  std::size_t line_no = 0;
  while (std::getline(iss, line)) {
    ++line_no;
    if (line.empty()) continue;
    if (line[0] == '#') {
      if (line != kMergesHeader) {
        throw CorruptStateError("unexpected merges header: " + line);
      }
      header_seen = true;
      continue;
    }
    std::istringstream fields(line);
    unsigned long long left = 0;
    unsigned long long right = 0;
    unsigned long long merged = 0;
    std::string extra;
    if (!(fields >> left >> right >> merged) || (fields >> extra)) {
      throw CorruptStateError("malformed merge on line " + std::to_string(line_no));
    }
    if (merged != next_id) {
      throw CorruptStateError("merge ids are not sequential on line " + std::to_string(line_no));
    }
    // Constituents must already have an expansion.
    auto resolved = [&](unsigned long long id) {
      return id < merged && (id >= base.size() || !base[id].empty());
    };
    if (!resolved(left) || !resolved(right)) {
      throw CorruptStateError("merge on line " + std::to_string(line_no) + " references an unknown id");
    }
    const TokenPair pair{static_cast<TokenId>(left), static_cast<TokenId>(right)};
    if (merges.Find(pair)) {
      throw CorruptStateError("duplicate merge on line " + std::to_string(line_no));
    }
    merges.Add(pair, next_id);
    ++next_id;
  }
  if (!header_seen) {
    throw CorruptStateError("merges blob has no version header");
  }
  return merges;
}
}  // namespace

void SaveTokenizerState(const BpeModel& model, const TrainerOptions& options, const std::string& directory) {
  const fs::path dir(directory);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("failed to create directory " + directory + ": " + ec.message());
  }

  nlohmann::json vocab = nlohmann::json::array();
  for (const auto& bytes : model.vocab) {
    if (bytes.empty()) {
      vocab.push_back(nullptr);
    } else {
      vocab.push_back(ByteLevelEncode(bytes));
    }
  }
  WriteBlob(dir / kVocabBlob, vocab.dump(2));

  std::ostringstream merges;
  merges << kMergesHeader << "\n";
  for (const auto& merge : model.merges.merges()) {
    merges << merge.pair.first << ' ' << merge.pair.second << ' ' << merge.id << "\n";
  }
  WriteBlob(dir / kMergesBlob, merges.str());

  nlohmann::json config;
  config["format_version"] = kFormatVersion;
  config["vocab_size"] = options.vocab_size;
  config["layout"] = std::string(LayoutName(model.specials.layout()));
  config["respect_chunk_boundaries"] = options.respect_chunk_boundaries;
  config["special_tokens"] = SpecialsToJson(model.specials);
  WriteBlob(dir / kConfigBlob, config.dump(2));
}

SavedTokenizer LoadTokenizerState(const std::string& directory) {
  const fs::path dir(directory);

  SpecialTokenLayout layout = SpecialTokenLayout::kOverlapping;
  TrainerOptions options = ParseConfig(ParseJsonBlob(dir / kConfigBlob), layout);

  BpeModel model = MakeBaseModel(layout);
  const Vocab loaded_vocab = ParseVocab(ParseJsonBlob(dir / kVocabBlob));
  model.merges = ParseMerges(ReadBlob(dir / kMergesBlob), model.specials, model.vocab);
  ExtendVocab(model.vocab, model.merges);

  if (loaded_vocab.size() != model.vocab.size()) {
    throw CorruptStateError("vocab has " + std::to_string(loaded_vocab.size()) + " entries, merges imply " +
                            std::to_string(model.vocab.size()));
  }
  for (std::size_t id = 0; id < loaded_vocab.size(); ++id) {
    if (loaded_vocab[id] != model.vocab[id]) {
      throw CorruptStateError("vocab entry " + std::to_string(id) + " does not match its merge");
    }
  }
  return SavedTokenizer{std::move(model), options};
}

}  // namespace bytepair
