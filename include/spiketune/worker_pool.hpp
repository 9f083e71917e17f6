#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace spiketune {

// Runs independent work items on up to `jobs` threads. Each engine session is its own
// process, so the threads mostly block on pipes; they live for one batch only.
class WorkerPool {
 public:
  explicit WorkerPool(int jobs) : jobs_(jobs < 1 ? 1 : jobs) {}

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  int size() const noexcept { return jobs_; }

  // Calls fn(index, workerId) once for every index in [0, count). Indices are handed out
  // in increasing order. The first exception stops the hand-out and is rethrown here
  // after every worker has joined.
  void for_each_index(std::size_t count, const std::function<void(std::size_t, int)>& fn) {
    if (count == 0) return;
    const int workers = static_cast<int>(std::min<std::size_t>(count, static_cast<std::size_t>(jobs_)));

    std::atomic<std::size_t> next{0};
    std::atomic<bool> stop{false};
    std::exception_ptr firstError;
    std::mutex errMu;

    auto drain = [&](int workerId) {
      while (!stop.load(std::memory_order_acquire)) {
        const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
        if (i >= count) return;
        try {
          fn(i, workerId);
        } catch (...) {
          std::lock_guard<std::mutex> lk(errMu);
          if (!firstError) firstError = std::current_exception();
          stop.store(true, std::memory_order_release);
        }
      }
    };

    if (workers == 1) {
      drain(0);
    } else {
      std::vector<std::thread> threads;
      threads.reserve(static_cast<std::size_t>(workers));
      for (int w = 0; w < workers; ++w) threads.emplace_back(drain, w);
      for (auto& t : threads) t.join();
    }

    if (firstError) std::rethrow_exception(firstError);
  }

 private:
  const int jobs_;
};

}  // namespace spiketune
