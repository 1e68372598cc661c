#include "bytepair/pretokenizer.hpp"

#include <unicode/regex.h>
#include <unicode/unistr.h>
#include <unicode/utext.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace bytepair {

namespace {
struct UTextCloser {
  void operator()(UText* ut) const noexcept { utext_close(ut); }
};

void CheckStatus(UErrorCode status, const char* what) {
  if (U_FAILURE(status)) {
    throw std::runtime_error(std::string("pretokenizer: ") + what + ": " + u_errorName(status));
  }
}
}  // namespace

struct Pretokenizer::Impl {
  std::unique_ptr<icu::RegexPattern> pattern;
};

Pretokenizer::Pretokenizer() : impl_(std::make_unique<Impl>()) {
  UErrorCode status = U_ZERO_ERROR;
  const auto pattern_u =
      icu::UnicodeString::fromUTF8(icu::StringPiece(kPattern.data(), static_cast<int32_t>(kPattern.size())));
  impl_->pattern.reset(icu::RegexPattern::compile(pattern_u, 0, status));
  CheckStatus(status, "failed to compile regex");
}

Pretokenizer::~Pretokenizer() = default;
Pretokenizer::Pretokenizer(Pretokenizer&&) noexcept = default;
Pretokenizer& Pretokenizer::operator=(Pretokenizer&&) noexcept = default;

std::vector<std::string_view> Pretokenizer::Split(std::string_view text) const {
  std::vector<std::string_view> chunks;
  if (text.empty()) {
    return chunks;
  }

  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<UText, UTextCloser> ut(
      utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status));
  CheckStatus(status, "failed to open input");

  std::unique_ptr<icu::RegexMatcher> matcher(impl_->pattern->matcher(status));
  CheckStatus(status, "failed to create matcher");
  matcher->reset(ut.get());

  // UTF-8 UText native indices are byte offsets into `text`.
  while (matcher->find(status)) {
    const int64_t begin = matcher->start64(status);
    const int64_t end = matcher->end64(status);
    CheckStatus(status, "match failed");
    if (end > begin) {
      chunks.push_back(text.substr(static_cast<std::size_t>(begin), static_cast<std::size_t>(end - begin)));
    }
  }
  CheckStatus(status, "match failed");
  return chunks;
}

}  // namespace bytepair
