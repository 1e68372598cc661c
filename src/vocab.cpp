#include "bytepair/vocab.hpp"

#include <stdexcept>

namespace bytepair {

namespace {
constexpr std::array<std::string_view, SpecialTokens::kCount> kSpecialTexts = {"<PAD>", "<UNK>", "<BOS>", "<EOS>"};
}  // namespace

std::string_view LayoutName(SpecialTokenLayout layout) {
  switch (layout) {
    case SpecialTokenLayout::kOverlapping:
      return "overlapping";
    case SpecialTokenLayout::kDisjoint:
      return "disjoint";
  }
  return "overlapping";
}

SpecialTokenLayout ParseLayout(std::string_view name) {
  if (name == "overlapping") {
    return SpecialTokenLayout::kOverlapping;
  }
  if (name == "disjoint") {
    return SpecialTokenLayout::kDisjoint;
  }
  throw std::invalid_argument("unknown special token layout: " + std::string(name));
}

SpecialTokens::SpecialTokens(SpecialTokenLayout layout) : layout_(layout) {
  const TokenId base = layout == SpecialTokenLayout::kDisjoint ? kNumByteTokens : 0;
  for (std::size_t i = 0; i < kCount; ++i) {
    tokens_[i] = SpecialToken{kSpecialTexts[i], base + static_cast<TokenId>(i)};
  }
}

bool SpecialTokens::Contains(TokenId id) const {
  return id >= tokens_.front().id && id <= tokens_.back().id;
}

void MergeTable::Add(TokenPair pair, TokenId id) {
  merges_.push_back(Merge{pair, id});
  index_[pair] = id;
}

std::optional<TokenId> MergeTable::Find(TokenPair pair) const {
  auto it = index_.find(pair);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Vocab BuildBaseVocab(const SpecialTokens& specials) {
  Vocab vocab(specials.FirstMergeId());
  for (TokenId b = 0; b < kNumByteTokens; ++b) {
    vocab[b] = std::string(1, static_cast<char>(b));
  }
  for (const auto& token : specials.all()) {
    vocab[token.id] = std::string(token.text);
  }
  return vocab;
}

void ExtendVocab(Vocab& vocab, const MergeTable& merges) {
  for (const auto& merge : merges.merges()) {
    if (vocab.size() <= merge.id) {
      vocab.resize(merge.id + 1);
    }
    vocab[merge.id] = vocab[merge.pair.first] + vocab[merge.pair.second];
  }
}

BpeModel MakeBaseModel(SpecialTokenLayout layout) {
  BpeModel model{SpecialTokens(layout), {}, {}};
  model.vocab = BuildBaseVocab(model.specials);
  return model;
}

}  // namespace bytepair
