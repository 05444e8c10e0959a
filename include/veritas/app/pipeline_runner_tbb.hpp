#pragma once

#include <veritas/app/pipeline_runner.hpp>
#include <veritas/core/pipeline.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef VERITAS_HAS_TBB

namespace veritas::app {

/// Analyzes a batch of videos in parallel using TBB.
///
/// Each job is run through the pipeline registered for \p profile_of(job) in
/// \p pipelines (e.g. one pipeline per dataset or per weight profile); jobs
/// whose profile has no pipeline are reported as InvalidConfig. The pipelines
/// hold only read-only state, so one pipeline may serve many TBB tasks at
/// once. Each job's source must be distinct.
///
/// \param pipelines Map from profile id to pipeline. Caller keeps ownership.
/// \param jobs Flat list of (profile id, job) pairs.
/// \param callback Invoked for every job with (video_id, result). Must be thread-safe.
void analyze_batch_tbb(
    const std::unordered_map<std::string, const veritas::core::AnalysisPipeline*>& pipelines,
    const std::vector<std::pair<std::string, VideoJob>>& jobs,
    VerdictCallback callback);

}  // namespace veritas::app

#endif  // VERITAS_HAS_TBB
