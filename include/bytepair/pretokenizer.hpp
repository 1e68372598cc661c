#pragma once

#include <memory>
#include <string_view>
#include <vector>

namespace bytepair {

// Regex segmentation applied to training text: contractions, letter runs with
// one optional leading symbol, digit runs of up to three, punctuation runs,
// newline runs and whitespace runs.
class Pretokenizer {
 public:
  static constexpr std::string_view kPattern =
      R"('(?i:[sdmt]|ll|ve|re)|[^\r\n\p{L}\p{N}]?+\p{L}+|\p{N}{1,3}| ?[^\s\p{L}\p{N}]++[\r\n]*|\s*[\r\n]|\s+(?!\S)|\s+)";

  Pretokenizer();
  ~Pretokenizer();
  Pretokenizer(Pretokenizer&&) noexcept;
  Pretokenizer& operator=(Pretokenizer&&) noexcept;

  // Chunks are views into `text`, in order. Bytes that are not valid UTF-8
  // are matched as U+FFFD but returned unchanged.
  [[nodiscard]] std::vector<std::string_view> Split(std::string_view text) const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace bytepair
