#include <veritas/app/pipeline_runner_tbb.hpp>

#ifdef VERITAS_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace veritas::app {

namespace vc = veritas::core;

void analyze_batch_tbb(
    const std::unordered_map<std::string, const vc::AnalysisPipeline*>& pipelines,
    const std::vector<std::pair<std::string, VideoJob>>& jobs,
    VerdictCallback callback) {
  if (jobs.empty() || !callback) return;

  const std::size_t n = jobs.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&pipelines, &jobs, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const std::string& profile = jobs[i].first;
          const VideoJob& job = jobs[i].second;
          auto it = pipelines.find(profile);
          if (it == pipelines.end() || it->second == nullptr) {
            callback(job.video_id, VerdictOrError(std::unexpected(vc::FusionError::InvalidConfig)));
            continue;
          }
          if (job.source == nullptr) {
            callback(job.video_id, VerdictOrError(std::unexpected(vc::FusionError::InvalidInput)));
            continue;
          }
          callback(job.video_id, it->second->run(*job.source));
        }
      });
}

}  // namespace veritas::app

#endif  // VERITAS_HAS_TBB
