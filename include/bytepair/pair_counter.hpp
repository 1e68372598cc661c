#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

#include "bytepair/vocab.hpp"

namespace bytepair {

// Adjacent-pair frequencies, iterable in the order each pair was first seen.
// That order is the tie-break rule of the merge learner.
class PairCounts {
 public:
  using Entry = std::pair<TokenPair, std::uint64_t>;

  void Add(TokenPair pair, std::uint64_t n = 1);

  [[nodiscard]] std::uint64_t Count(TokenPair pair) const;
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }

  // Highest count; among equal counts the earliest-seen pair.
  [[nodiscard]] std::optional<Entry> MostFrequent() const;

 private:
  std::vector<Entry> entries_;
  std::unordered_map<TokenPair, std::size_t, PairHash> index_;
};

// Adds every adjacent pair of `seq`, each weighted by `weight`.
void CountPairs(std::span<const TokenId> seq, PairCounts& counts, std::uint64_t weight = 1);

[[nodiscard]] PairCounts CountPairs(std::span<const TokenId> seq);

// Replaces every non-overlapping occurrence of `pair`, scanning left to
// right, with `new_id`. Returns the number of replacements.
std::size_t MergePair(std::vector<TokenId>& seq, TokenPair pair, TokenId new_id);

}  // namespace bytepair
