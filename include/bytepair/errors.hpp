#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace bytepair {

class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Raised by training when the corpus runs out of adjacent pairs before the
// requested vocabulary size is reached.
class InsufficientDataError : public Error {
 public:
  InsufficientDataError(std::size_t requested_vocab_size, std::size_t achieved_vocab_size)
      : Error("insufficient training data: requested vocab size " + std::to_string(requested_vocab_size) +
              ", corpus supports " + std::to_string(achieved_vocab_size)),
        requested_(requested_vocab_size),
        achieved_(achieved_vocab_size) {}

  [[nodiscard]] std::size_t requested_vocab_size() const noexcept { return requested_; }
  [[nodiscard]] std::size_t achieved_vocab_size() const noexcept { return achieved_; }

 private:
  std::size_t requested_;
  std::size_t achieved_;
};

// Raised by Load when a persisted blob is missing or does not describe a
// consistent tokenizer.
class CorruptStateError : public Error {
 public:
  using Error::Error;
};

}  // namespace bytepair
