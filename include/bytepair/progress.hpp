#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace bytepair {

// Throttled "[label] unit done/total" lines on stderr.
class ProgressTracker {
 public:
  ProgressTracker(std::uint64_t total, std::string label, std::uint64_t interval_ms, std::string unit = "steps");

  void Add(std::uint64_t steps);
  void Finish();

  [[nodiscard]] std::uint64_t done() const { return done_; }

 private:
  void MaybePrint(bool force);

  std::string label_;
  std::string unit_;
  std::uint64_t total_ = 0;
  std::uint64_t done_ = 0;
  std::uint64_t interval_ms_ = 1000;
  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point last_print_;
};

}  // namespace bytepair
