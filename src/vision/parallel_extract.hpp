#pragma once

#include <veritas/core/frame_feature_record.hpp>
#include <algorithm>
#include <cstddef>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace veritas::vision::detail {

inline std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

/// Calls extract_one(i) for i in [0, n) on a worker pool and collects the
/// records in completion order. extract_one must be safe to call concurrently.
template <typename ExtractOne>
std::vector<veritas::core::FrameFeatureRecord> extract_parallel(
    std::size_t n,
    std::size_t num_workers,
    ExtractOne extract_one) {
  std::vector<veritas::core::FrameFeatureRecord> out;
  out.reserve(n);
  if (n == 0) return out;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    for (std::size_t i = 0; i < n; ++i) out.push_back(extract_one(i));
    return out;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) index_queue.push(i);
  std::mutex queue_mutex;
  std::mutex out_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      auto record = extract_one(idx);
      std::lock_guard lock(out_mutex);
      out.push_back(std::move(record));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) threads.emplace_back(worker);
  for (auto& t : threads) t.join();
  return out;
}

}  // namespace veritas::vision::detail
