#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bytepair {

using TokenId = std::uint32_t;
using TokenPair = std::pair<TokenId, TokenId>;

inline constexpr TokenId kNumByteTokens = 256;

struct PairHash {
  std::size_t operator()(const TokenPair& p) const noexcept {
    const std::uint64_t key = (static_cast<std::uint64_t>(p.first) << 32u) | p.second;
    return std::hash<std::uint64_t>{}(key);
  }
};

// Where the reserved special tokens live in the id space.
//
// kOverlapping reproduces the reference numbering: PAD/UNK/BOS/EOS take ids
// 0-3 and shadow raw bytes 0x00-0x03, which become unrepresentable.
// kDisjoint places them at 256-259 so every byte keeps its own id. Merge ids
// start at 260 in both layouts.
enum class SpecialTokenLayout {
  kOverlapping,
  kDisjoint,
};

[[nodiscard]] std::string_view LayoutName(SpecialTokenLayout layout);
// Throws std::invalid_argument for an unknown name.
[[nodiscard]] SpecialTokenLayout ParseLayout(std::string_view name);

struct SpecialToken {
  std::string_view text;
  TokenId id;
};

class SpecialTokens {
 public:
  static constexpr std::size_t kCount = 4;

  explicit SpecialTokens(SpecialTokenLayout layout = SpecialTokenLayout::kOverlapping);

  [[nodiscard]] SpecialTokenLayout layout() const { return layout_; }
  [[nodiscard]] TokenId pad() const { return tokens_[0].id; }
  [[nodiscard]] TokenId unk() const { return tokens_[1].id; }
  [[nodiscard]] TokenId bos() const { return tokens_[2].id; }
  [[nodiscard]] TokenId eos() const { return tokens_[3].id; }
  [[nodiscard]] const std::array<SpecialToken, kCount>& all() const { return tokens_; }

  [[nodiscard]] bool Contains(TokenId id) const;
  [[nodiscard]] TokenId FirstMergeId() const { return kNumByteTokens + static_cast<TokenId>(kCount); }

 private:
  SpecialTokenLayout layout_;
  std::array<SpecialToken, kCount> tokens_;
};

struct Merge {
  TokenPair pair;
  TokenId id;
};

// Learned merges in creation order, indexed by pair. The id of a merge is
// also its priority: lower ids were learned earlier and apply first.
class MergeTable {
 public:
  void Add(TokenPair pair, TokenId id);

  [[nodiscard]] std::optional<TokenId> Find(TokenPair pair) const;
  [[nodiscard]] std::size_t size() const { return merges_.size(); }
  [[nodiscard]] bool empty() const { return merges_.empty(); }
  [[nodiscard]] const std::vector<Merge>& merges() const { return merges_; }

 private:
  std::vector<Merge> merges_;
  std::unordered_map<TokenPair, TokenId, PairHash> index_;
};

// Id to byte string. An empty entry marks an id with no expansion (ids
// 256-259 in the overlapping layout).
using Vocab = std::vector<std::string>;

struct BpeModel {
  SpecialTokens specials;
  Vocab vocab;
  MergeTable merges;
};

// 256 raw bytes plus the special-token strings placed per layout.
[[nodiscard]] Vocab BuildBaseVocab(const SpecialTokens& specials);

// Appends the expansion of every merge, in creation order.
void ExtendVocab(Vocab& vocab, const MergeTable& merges);

[[nodiscard]] BpeModel MakeBaseModel(SpecialTokenLayout layout);

}  // namespace bytepair
