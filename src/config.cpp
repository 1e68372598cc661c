#include "bytepair/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace bytepair {

namespace {
std::string Trim(const std::string& s) {
  std::size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  std::size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      out.push_back(Trim(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(Trim(cur));
  out.erase(std::remove_if(out.begin(), out.end(), [](const std::string& v) { return v.empty(); }), out.end());
  return out;
}

std::string ToLower(std::string s) {
  for (char& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}
}  // namespace

std::unordered_map<std::string, std::string> ReadEnvFile(const std::string& path) {
  std::unordered_map<std::string, std::string> env;
  std::ifstream in(path);
  if (!in) {
    return env;
  }
  bool first_line = true;
  std::string line;
  while (std::getline(in, line)) {
    if (first_line) {
      first_line = false;
      if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
          static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
      }
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    auto trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string key = Trim(trimmed.substr(0, eq));
    std::string val = Trim(trimmed.substr(eq + 1));
    if (val.size() >= 2 &&
        ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    env[key] = val;
  }
  return env;
}

std::size_t ParseSize(const std::string& key, const std::string& value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(),
                                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw std::invalid_argument("invalid value for " + key + ": " + value);
  }
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("value out of range for " + key + ": " + value);
  }
  if (parsed > std::numeric_limits<std::size_t>::max()) {
    throw std::invalid_argument("value out of range for " + key + ": " + value);
  }
  return static_cast<std::size_t>(parsed);
}

TokenId ParseTokenId(const std::string& key, const std::string& value) {
  const std::size_t id = ParseSize(key, value);
  if (id > std::numeric_limits<TokenId>::max()) {
    throw std::invalid_argument("token id out of range for " + key + ": " + value);
  }
  return static_cast<TokenId>(id);
}

bool ParseBool(const std::string& key, const std::string& value) {
  const std::string v = ToLower(value);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    return false;
  }
  throw std::invalid_argument("invalid boolean for " + key + ": " + value);
}

void ApplyEnvOverrides(Config& cfg, const std::unordered_map<std::string, std::string>& env) {
  auto get = [&](const std::string& key) -> const std::string* {
    auto it = env.find(key);
    if (it == env.end()) {
      return nullptr;
    }
    return &it->second;
  };
  if (auto v = get("DATA_PATH"))
    cfg.data_files = SplitCsv(*v);
  if (auto v = get("TEXT_FIELD"))
    cfg.text_field = *v;
  if (auto v = get("OUTPUT_DIR"))
    cfg.output_dir = *v;
  if (auto v = get("TOKENIZER_DIR"))
    cfg.tokenizer_dir = *v;
  if (auto v = get("VOCAB_SIZE"))
    cfg.vocab_size = ParseSize("VOCAB_SIZE", *v);
  if (auto v = get("LAYOUT"))
    cfg.layout = ParseLayout(ToLower(*v));
  if (auto v = get("RESPECT_BOUNDARIES"))
    cfg.respect_chunk_boundaries = ParseBool("RESPECT_BOUNDARIES", *v);
  if (auto v = get("ALLOW_EARLY_STOP"))
    cfg.allow_early_stop = ParseBool("ALLOW_EARLY_STOP", *v);
  if (auto v = get("PROGRESS_INTERVAL_MS"))
    cfg.progress_interval_ms = ParseSize("PROGRESS_INTERVAL_MS", *v);
}

std::string DetectEnvPathArg(int argc, char** argv, const std::string& default_path) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--env") {
      return argv[i + 1];
    }
  }
  return default_path;
}

TrainerOptions MakeTrainerOptions(const Config& cfg) {
  TrainerOptions options;
  options.vocab_size = cfg.vocab_size;
  options.layout = cfg.layout;
  options.respect_chunk_boundaries = cfg.respect_chunk_boundaries;
  options.allow_early_stop = cfg.allow_early_stop;
  options.progress_interval_ms = cfg.progress_interval_ms;
  return options;
}

}  // namespace bytepair
