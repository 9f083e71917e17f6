#pragma once
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace spiketune {

// One-line session counter redrawn in place: done/total, percent, elapsed, ETA, sessions
// per second and an optional status. Updates may come from any worker thread.
class ProgressMeter {
 public:
  using Clock = std::chrono::steady_clock;

  ProgressMeter(std::string label, std::size_t total, bool enabled = true,
                std::chrono::milliseconds redraw = std::chrono::milliseconds(750), std::ostream& out = std::cerr)
      : label_(std::move(label)),
        total_(total),
        enabled_(enabled && total > 0),
        redraw_(redraw),
        out_(out),
        start_(Clock::now()),
        lastDraw_(start_) {}

  ProgressMeter(const ProgressMeter&) = delete;
  ProgressMeter& operator=(const ProgressMeter&) = delete;

  ~ProgressMeter() { finish(); }

  void add(std::size_t n = 1) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!enabled_ || finished_) return;
    done_ = std::min(total_, done_ + n);
    const auto now = Clock::now();
    if (done_ == total_ || now - lastDraw_ >= redraw_) draw(now);
  }

  void set_status(std::string s) {
    std::lock_guard<std::mutex> lk(mu_);
    status_ = std::move(s);
  }

  void finish() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!enabled_ || finished_) return;
    finished_ = true;
    draw(Clock::now());
    out_ << "\n" << std::flush;
  }

  std::size_t done() const {
    std::lock_guard<std::mutex> lk(mu_);
    return done_;
  }

 private:
  static std::string clock_text(double seconds) {
    const long t = static_cast<long>(seconds + 0.5);
    std::ostringstream os;
    if (t >= 3600) os << t / 3600 << "h" << std::setw(2) << std::setfill('0') << (t % 3600) / 60 << "m";
    else os << t / 60 << "m" << std::setw(2) << std::setfill('0') << t % 60 << "s";
    return os.str();
  }

  // Caller holds mu_.
  void draw(Clock::time_point now) {
    lastDraw_ = now;
    const double elapsed = std::chrono::duration<double>(now - start_).count();
    const double perSec = elapsed > 0.0 ? static_cast<double>(done_) / elapsed : 0.0;
    const double left = perSec > 0.0 ? static_cast<double>(total_ - done_) / perSec : 0.0;

    out_ << "\r" << label_ << " sessions " << done_ << "/" << total_ << " " << std::fixed << std::setprecision(1)
         << 100.0 * static_cast<double>(done_) / static_cast<double>(total_) << "% elapsed=" << clock_text(elapsed)
         << " eta=" << clock_text(left) << " rate=" << std::setprecision(2) << perSec << "/s";
    if (!status_.empty()) out_ << " " << status_;
    out_ << std::flush;
  }

  const std::string label_;
  const std::size_t total_;
  const bool enabled_;
  const std::chrono::milliseconds redraw_;
  std::ostream& out_;

  mutable std::mutex mu_;
  std::size_t done_ = 0;
  bool finished_ = false;
  std::string status_;
  const Clock::time_point start_;
  Clock::time_point lastDraw_;
};

}  // namespace spiketune
