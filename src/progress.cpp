#include "bytepair/progress.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace bytepair {

namespace {
std::string FormatDuration(double seconds) {
  const int sec = static_cast<int>(seconds + 0.5);
  const int h = sec / 3600;
  const int m = (sec % 3600) / 60;
  const int s = sec % 60;
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
  return oss.str();
}
}  // namespace

ProgressTracker::ProgressTracker(std::uint64_t total, std::string label, std::uint64_t interval_ms, std::string unit)
    : label_(std::move(label)), unit_(std::move(unit)), total_(total), interval_ms_(interval_ms) {
  start_ = std::chrono::steady_clock::now();
  last_print_ = start_;
}

void ProgressTracker::Add(std::uint64_t steps) {
  done_ += steps;
  MaybePrint(false);
}

void ProgressTracker::Finish() { MaybePrint(true); }

void ProgressTracker::MaybePrint(bool force) {
  auto now = std::chrono::steady_clock::now();
  if (!force) {
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_print_).count();
    if (delta < static_cast<long long>(interval_ms_)) {
      return;
    }
  }
  last_print_ = now;

  const std::uint64_t total = total_;
  const std::uint64_t done = done_;
  const double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_).count();
  const double rate = elapsed > 0.0 ? static_cast<double>(done) / elapsed : 0.0;
  const double eta = (rate > 0.0 && total > done) ? static_cast<double>(total - done) / rate : 0.0;

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss << "[" << label_ << "] " << unit_ << " " << done;
  if (total > 0) {
    const double pct = 100.0 * static_cast<double>(done) / static_cast<double>(total);
    oss << "/" << total << " (" << std::setprecision(1) << pct << "%)";
  }
  if (rate > 0.0) {
    oss << " rate " << std::setprecision(2) << rate << "/s";
  }
  oss << " elapsed " << FormatDuration(elapsed);
  if (eta > 0.0) {
    oss << " ETA " << FormatDuration(eta);
  }
  oss << "\n";
  std::cerr << oss.str();
}

}  // namespace bytepair
