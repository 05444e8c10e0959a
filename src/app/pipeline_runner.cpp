#include <veritas/app/pipeline_runner.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace veritas::app {

namespace vc = veritas::core;

namespace {

VerdictOrError run_job(const vc::AnalysisPipeline& pipeline, const VideoJob& job) {
  if (job.source == nullptr) {
    return std::unexpected(vc::FusionError::InvalidInput);
  }
  return pipeline.run(*job.source);
}

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

VerdictOrError analyze_video(const vc::AnalysisPipeline& pipeline,
                             vc::ILevelFeatureSource& source,
                             LevelTimingCallback* timing_cb) {
  return pipeline.run(source, timing_cb);
}

void analyze_batch(const vc::AnalysisPipeline& pipeline,
                   const std::vector<VideoJob>& jobs,
                   VerdictCallback callback) {
  for (const auto& job : jobs) {
    auto result = run_job(pipeline, job);
    if (callback) callback(job.video_id, result);
  }
}

void analyze_batch_parallel(const vc::AnalysisPipeline& pipeline,
                            const std::vector<VideoJob>& jobs,
                            VerdictCallback callback,
                            std::size_t num_workers) {
  const std::size_t n = jobs.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    analyze_batch(pipeline, jobs, std::move(callback));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }

  std::mutex queue_mutex;
  std::condition_variable queue_cv;
  std::atomic<bool> producer_done{false};

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::unique_lock lock(queue_mutex);
        queue_cv.wait(lock, [&]() {
          return producer_done.load() || !index_queue.empty();
        });
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      auto result = run_job(pipeline, jobs[idx]);
      callback(jobs[idx].video_id, result);
    }
  };

  producer_done = true;
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  queue_cv.notify_all();

  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace veritas::app
