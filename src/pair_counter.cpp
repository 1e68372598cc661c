#include "bytepair/pair_counter.hpp"

namespace bytepair {

void PairCounts::Add(TokenPair pair, std::uint64_t n) {
  auto [it, inserted] = index_.try_emplace(pair, entries_.size());
  if (inserted) {
    entries_.emplace_back(pair, n);
  } else {
    entries_[it->second].second += n;
  }
}

std::uint64_t PairCounts::Count(TokenPair pair) const {
  auto it = index_.find(pair);
  return it == index_.end() ? 0 : entries_[it->second].second;
}

std::optional<PairCounts::Entry> PairCounts::MostFrequent() const {
  if (entries_.empty()) {
    return std::nullopt;
  }
  const Entry* best = &entries_.front();
  for (const auto& entry : entries_) {
    if (entry.second > best->second) {
      best = &entry;
    }
  }
  return *best;
}

void CountPairs(std::span<const TokenId> seq, PairCounts& counts, std::uint64_t weight) {
  for (std::size_t i = 0; i + 1 < seq.size(); ++i) {
    counts.Add({seq[i], seq[i + 1]}, weight);
  }
}

PairCounts CountPairs(std::span<const TokenId> seq) {
  PairCounts counts;
  CountPairs(seq, counts);
  return counts;
}

std::size_t MergePair(std::vector<TokenId>& seq, TokenPair pair, TokenId new_id) {
  if (seq.size() < 2) {
    return 0;
  }
  std::size_t replaced = 0;
  std::vector<TokenId> merged;
  merged.reserve(seq.size());
  for (std::size_t i = 0; i < seq.size();) {
    if (i + 1 < seq.size() && seq[i] == pair.first && seq[i + 1] == pair.second) {
      merged.push_back(new_id);
      ++replaced;
      i += 2;
    } else {
      merged.push_back(seq[i]);
      ++i;
    }
  }
  seq.swap(merged);
  return replaced;
}

}  // namespace bytepair
