#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "bytepair/config.hpp"
#include "bytepair/errors.hpp"
#include "bytepair/tokenizer.hpp"

using namespace bytepair;

namespace {
void PrintUsage() {
  std::cerr << "Usage:\n"
            << "  bytepair_cli train [options] [--data FILE]...\n"
            << "  bytepair_cli encode [--tokenizer DIR] [--bos] [--eos] TEXT...\n"
            << "  bytepair_cli decode [--tokenizer DIR] [--keep-special] ID...\n\n"
            << "Train options:\n"
            << "  --env <path>                Path to .env (default: .env)\n"
            << "  --data <file>               Corpus file, repeatable (overrides DATA_PATH)\n"
            << "  --text-field <name>         JSONL field name (default: text)\n"
            << "  --vocab-size <n>            Target vocab size incl. bytes and specials (default: 1024)\n"
            << "  --output <dir>              Output directory (default: tokenizer)\n"
            << "  --layout <name>             overlapping | disjoint (default: overlapping)\n"
            << "  --respect-boundaries        Never merge across pretokenizer chunks\n"
            << "  --allow-early-stop          Keep a smaller vocab when the corpus runs out of pairs\n"
            << "  --progress-interval <ms>    Progress update interval, 0 disables (default: 1000)\n";
}

// Parses flags into `cfg`; everything that is not a flag lands in `positional`.
bool ParseArgs(int argc, char** argv, Config& cfg, std::vector<std::string>& positional, bool& bos, bool& eos,
               bool& keep_special) {
  bool data_from_args = false;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument("missing value for " + arg);
      }
      return argv[++i];
    };
    if (arg == "--help" || arg == "-h") {
      return false;
    } else if (arg == "--env") {
      cfg.env_path = next();
    } else if (arg == "--data") {
      if (!data_from_args) {
        cfg.data_files.clear();
        data_from_args = true;
      }
      cfg.data_files.push_back(next());
    } else if (arg == "--text-field") {
      cfg.text_field = next();
    } else if (arg == "--vocab-size") {
      cfg.vocab_size = ParseSize(arg, next());
    } else if (arg == "--output") {
      cfg.output_dir = next();
    } else if (arg == "--tokenizer") {
      cfg.tokenizer_dir = next();
    } else if (arg == "--layout") {
      cfg.layout = ParseLayout(next());
    } else if (arg == "--respect-boundaries") {
      cfg.respect_chunk_boundaries = true;
    } else if (arg == "--allow-early-stop") {
      cfg.allow_early_stop = true;
    } else if (arg == "--progress-interval") {
      cfg.progress_interval_ms = ParseSize(arg, next());
    } else if (arg == "--bos") {
      bos = true;
    } else if (arg == "--eos") {
      eos = true;
    } else if (arg == "--keep-special") {
      keep_special = true;
    } else if (arg.rfind("--", 0) == 0) {
      throw std::invalid_argument("unknown arg: " + arg);
    } else {
      positional.push_back(arg);
    }
  }
  return true;
}

int RunTrain(const Config& cfg) {
  if (cfg.data_files.empty()) {
    std::cerr << "DATA_PATH not set in .env and --data not provided.\n";
    return 1;
  }
  std::cerr << "Files: " << cfg.data_files.size() << "\n";
  std::cerr << "Vocab size: " << cfg.vocab_size << "\n";
  std::cerr << "Layout: " << LayoutName(cfg.layout) << "\n";
  std::cerr << "Respect boundaries: " << (cfg.respect_chunk_boundaries ? "yes" : "no") << "\n";

  ByteLevelBPETokenizer tokenizer(MakeTrainerOptions(cfg));
  CorpusReadOptions ropts;
  ropts.text_field = cfg.text_field;
  const auto stats = tokenizer.TrainFromFiles(cfg.data_files, ropts);

  std::cerr << "Corpus bytes: " << stats.corpus_bytes << "\n";
  std::cerr << "Merges: " << stats.merges << "\n";
  std::cerr << "Tokens after merges: " << stats.final_tokens << "\n";
  tokenizer.Save(cfg.output_dir);
  std::cerr << "Saved tokenizer: " << cfg.output_dir << " (vocab=" << tokenizer.VocabSize() << ")\n";
  return 0;
}

int RunEncode(const Config& cfg, const std::vector<std::string>& texts, bool bos, bool eos) {
  const auto tokenizer = ByteLevelBPETokenizer::Load(cfg.tokenizer_dir);
  std::string text;
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) text.push_back(' ');
    text += texts[i];
  }
  const auto ids = tokenizer.Encode(text, EncodeOptions{bos, eos});
  for (std::size_t i = 0; i < ids.size(); ++i) {
    std::cout << (i > 0 ? " " : "") << ids[i];
  }
  std::cout << "\n";
  return 0;
}

int RunDecode(const Config& cfg, const std::vector<std::string>& values, bool keep_special) {
  const auto tokenizer = ByteLevelBPETokenizer::Load(cfg.tokenizer_dir);
  std::vector<TokenId> ids;
  ids.reserve(values.size());
  for (const auto& v : values) {
    ids.push_back(ParseTokenId("id", v));
  }
  std::cout << tokenizer.Decode(ids, DecodeOptions{!keep_special}) << "\n";
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return 1;
  }
  const std::string cmd = argv[1];

  Config cfg;
  std::vector<std::string> positional;
  bool bos = false;
  bool eos = false;
  bool keep_special = false;
  try {
    cfg.env_path = DetectEnvPathArg(argc, argv, cfg.env_path);
    ApplyEnvOverrides(cfg, ReadEnvFile(cfg.env_path));
    if (!ParseArgs(argc, argv, cfg, positional, bos, eos, keep_special)) {
      PrintUsage();
      return 0;
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    PrintUsage();
    return 1;
  }

  try {
    if (cmd == "train") {
      return RunTrain(cfg);
    }
    if (cmd == "encode") {
      return RunEncode(cfg, positional, bos, eos);
    }
    if (cmd == "decode") {
      return RunDecode(cfg, positional, keep_special);
    }
  } catch (const InsufficientDataError& e) {
    std::cerr << e.what() << " (rerun with --allow-early-stop to keep the smaller vocab)\n";
    return 2;
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  PrintUsage();
  return 1;
}
