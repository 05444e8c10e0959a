#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/feature_source.hpp>
#include <veritas/core/pipeline.hpp>
#include <veritas/core/verdict.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace veritas::app {

/// One video to analyze: an id for reporting and its feature source.
/// The source is owned by the caller and must outlive the run.
struct VideoJob {
  std::string video_id;
  veritas::core::ILevelFeatureSource* source{nullptr};
};

using VerdictOrError =
    std::expected<veritas::core::Verdict, veritas::core::FusionError>;

/// Callback for each analyzed video, successful or not; may be invoked from
/// worker threads. Must be thread-safe if using analyze_batch_parallel.
using VerdictCallback =
    std::function<void(const std::string& video_id, const VerdictOrError& result)>;

/// Optional per-level timing: (level, duration_ms).
using LevelTimingCallback = veritas::core::LevelTimingCallback;

/// Runs the pipeline on a single video. No threading; direct call.
[[nodiscard]] VerdictOrError analyze_video(
    const veritas::core::AnalysisPipeline& pipeline,
    veritas::core::ILevelFeatureSource& source,
    LevelTimingCallback* timing_cb = nullptr);

/// Runs the pipeline on multiple videos sequentially; calls callback for each.
/// A job without a source is reported as InvalidInput.
void analyze_batch(const veritas::core::AnalysisPipeline& pipeline,
                   const std::vector<VideoJob>& jobs,
                   VerdictCallback callback);

/// Runs the pipeline on multiple videos in parallel using a thread pool.
/// AnalysisPipeline::run() is called from worker threads, one job per worker
/// at a time; each job's source is touched by exactly one thread.
/// num_workers 0 = use hardware concurrency.
void analyze_batch_parallel(const veritas::core::AnalysisPipeline& pipeline,
                            const std::vector<VideoJob>& jobs,
                            VerdictCallback callback,
                            std::size_t num_workers = 0);

}  // namespace veritas::app
