#pragma once

#include <functional>
#include <string>
#include <vector>

namespace bytepair {

struct CorpusReadOptions {
  std::string text_field = "text";
};

// Reads training text. Plain, .gz and .xz files yield one record holding the
// whole (decompressed) file; .jsonl files, compressed or not, yield the
// `text_field` string of every line that has one.
class CorpusReader {
 public:
  explicit CorpusReader(CorpusReadOptions options = {});

  // Throws std::runtime_error if the file cannot be read or decompressed.
  void ForEachRecord(const std::string& path, const std::function<void(const std::string&)>& fn) const;

  // Records of all files in order, joined by a newline unless a record
  // already ends with one.
  [[nodiscard]] std::string ReadCorpus(const std::vector<std::string>& paths) const;

 private:
  bool read_plain(const std::string& path, std::string& out) const;
  bool read_gz(const std::string& path, std::string& out) const;
  bool read_xz(const std::string& path, std::string& out) const;
  void for_each_json_line(const std::string& payload, const std::function<void(const std::string&)>& fn) const;

  CorpusReadOptions options_;
};

}  // namespace bytepair
