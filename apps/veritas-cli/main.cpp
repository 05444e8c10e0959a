/**
 * veritas-cli: run multi-level deepfake evidence fusion on one video or a dataset.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/veritas_cli [--config path] [--features csv] [--faces dir]
 *        ./build/veritas_cli [--config path] --dataset manifest [--workers n]
 * With --features: also writes the report to output/<basename>.txt (same content as terminal).
 */

#include <veritas/app/config.hpp>
#include <veritas/app/dataset_evaluation.hpp>
#include <veritas/app/feature_csv.hpp>
#include <veritas/app/pipeline_runner.hpp>
#include <veritas/core/escalation_controller.hpp>
#include <veritas/core/level.hpp>
#include <veritas/core/mock_feature_source.hpp>
#include <veritas/core/pipeline.hpp>
#include <veritas/core/verdict.hpp>
#include <veritas/levels/evaluator_factory.hpp>
#include <veritas/vision/image_feature_source.hpp>
#include <veritas/vision/load_image.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <numbers>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

namespace vc = veritas::core;
namespace va = veritas::app;
namespace vv = veritas::vision;

/// Synthetic 3 s clip at 30 fps with natural-looking signals on every level.
vc::MockFeatureSource make_demo_source() {
  constexpr std::size_t kFrames = 90;
  constexpr double kFps = 30.0;
  vc::MockFeatureSource source;
  std::vector<vc::FrameFeatureRecord> expression;
  std::vector<vc::FrameFeatureRecord> blink;
  std::vector<vc::FrameFeatureRecord> headpose;
  std::vector<vc::FrameFeatureRecord> lipsync;
  for (std::size_t i = 0; i < kFrames; ++i) {
    const double t = static_cast<double>(i) / kFps;
    const double phase = 2.0 * std::numbers::pi * t;
    vc::FrameFeatureRecord r{.frame_index = i, .timestamp = t};

    r.level = vc::LevelId::Expression;
    r.raw_metrics = {{"expression_label", static_cast<double>((i / 15) % 3)},
                     {"expression_confidence", 0.8}};
    expression.push_back(r);

    r.level = vc::LevelId::Blink;
    r.raw_metrics = {{"EAR", (i >= 40 && i < 43) ? 0.1 : 0.3 + 0.01 * std::sin(phase)}};
    blink.push_back(r);

    r.level = vc::LevelId::HeadPose;
    const double disp = 2.0 + std::sin(phase * 0.7);
    r.raw_metrics = {{"yaw", 10.0 * std::sin(phase * 0.5)},
                     {"pitch", 3.0 * std::cos(phase * 0.3)},
                     {"roll", 1.0},
                     {"expected_disp", disp},
                     {"observed_disp", disp * 1.05}};
    headpose.push_back(r);

    r.level = vc::LevelId::LipSync;
    r.raw_metrics = {{"MAR", 0.3 + 0.2 * std::sin(phase)},
                     {"audio_energy", 0.5 + 0.4 * std::sin(phase)}};
    lipsync.push_back(r);
  }
  source.set_records(vc::LevelId::Expression, std::move(expression));
  source.set_records(vc::LevelId::Blink, std::move(blink));
  source.set_records(vc::LevelId::HeadPose, std::move(headpose));
  source.set_records(vc::LevelId::Texture,
                     vc::make_uniform_records(vc::LevelId::Texture, kFrames,
                                              {{"texture_score", 0.2}}, kFps));
  source.set_records(vc::LevelId::Color,
                     vc::make_uniform_records(vc::LevelId::Color, kFrames,
                                              {{"hue_delta", 2.0}, {"luma_delta", 3.0}}, kFps));
  source.set_records(vc::LevelId::LipSync, std::move(lipsync));
  return source;
}

/// Whole-string numeric argument; nullopt on trailing text or overflow.
template <typename T>
std::optional<T> parse_number(std::string_view text) {
  T value{};
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
  return value;
}

std::vector<std::filesystem::path> sorted_images(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> out;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    std::string ext = entry.path().extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp") {
      out.push_back(entry.path());
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

/// Face crops from \p faces_dir; a same-named file in \p context_dir (if given)
/// becomes the sample's context region.
std::vector<vv::FaceSample> load_samples(const std::string& faces_dir,
                                         const std::string& context_dir,
                                         double fps) {
  std::vector<vv::FaceSample> samples;
  std::uint64_t index = 0;
  for (const auto& path : sorted_images(faces_dir)) {
    const double t = static_cast<double>(index) / fps;
    auto face = vv::load_face_frame(path.string(), index, t);
    if (!face) {
      std::cerr << "Skipping unreadable image: " << path << "\n";
      continue;
    }
    vv::FaceSample sample{std::move(*face), std::nullopt};
    if (!context_dir.empty()) {
      const auto ctx_path = std::filesystem::path(context_dir) / path.filename();
      if (std::filesystem::exists(ctx_path)) {
        sample.context = vv::load_face_frame(ctx_path.string(), index, t);
      }
    }
    samples.push_back(std::move(sample));
    ++index;
  }
  return samples;
}

std::string format_verdict(const vc::Verdict& v) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3);
  out << "decision=" << vc::to_string(v.decision) << " probability=" << v.probability
      << " reason=" << vc::to_string(v.reason) << " levels_run=" << v.levels_run.size() << "\n";
  for (const auto& r : v.level_results) {
    out << "  [" << static_cast<int>(r.level) << "] " << std::left << std::setw(10)
        << vc::to_string(r.level) << std::right << " " << vc::to_string(r.status);
    if (r.score) out << " score=" << *r.score;
    out << " support=" << r.support;
    if (r.suspicious) out << " SUSPICIOUS";
    if (!r.detail.reasons.empty()) {
      out << " reasons=";
      for (std::size_t i = 0; i < r.detail.reasons.size(); ++i) {
        out << (i ? "," : "") << r.detail.reasons[i];
      }
    }
    if (!r.detail.notes.empty()) {
      out << " notes=";
      for (std::size_t i = 0; i < r.detail.notes.size(); ++i) {
        out << (i ? "," : "") << r.detail.notes[i];
      }
    }
    out << "\n";
  }
  if (!v.triggered_flags.empty()) {
    out << "  triggered:";
    for (const auto level : v.triggered_flags) out << " " << vc::to_string(level);
    out << "\n";
  }
  return out.str();
}

struct DatasetEntry {
  va::ManifestEntry label;
  std::unique_ptr<va::TableFeatureSource> source;
};

/// Manifest lines: "<real|fake>,<features.csv>" (relative paths resolve
/// against the manifest's directory).
int run_dataset(const vc::AnalysisPipeline& pipeline,
                const std::string& manifest_path,
                std::size_t workers) {
  std::ifstream manifest(manifest_path);
  if (!manifest) {
    std::cerr << "Failed to open dataset manifest: " << manifest_path << "\n";
    return 1;
  }
  std::ostringstream text;
  text << manifest.rdbuf();
  std::size_t bad_manifest_line = 0;
  auto listed = va::parse_dataset_manifest(text.str(), &bad_manifest_line);
  if (!listed) {
    std::cerr << "Bad manifest line " << bad_manifest_line << " in " << manifest_path
              << " (expected <real|fake>,<csv>; each csv listed once)\n";
    return 1;
  }

  const auto base = std::filesystem::path(manifest_path).parent_path();
  std::vector<DatasetEntry> entries;
  for (auto& label : *listed) {
    std::filesystem::path csv = label.features_path;
    if (csv.is_relative()) csv = base / csv;
    std::size_t bad_line = 0;
    auto table = va::read_feature_csv(csv.string(), &bad_line);
    if (!table) {
      std::cerr << "Failed to read features " << csv << " (line " << bad_line << ")\n";
      return 1;
    }
    entries.push_back({std::move(label),
                       std::make_unique<va::TableFeatureSource>(std::move(*table))});
  }

  // Video ids are unique per manifest, so each verdict finds its own label.
  std::vector<va::VideoJob> jobs;
  std::map<std::string, va::GroundTruth> truths;
  for (const auto& e : entries) {
    jobs.push_back({e.label.video_id, e.source.get()});
    truths.emplace(e.label.video_id, e.label.truth);
  }

  va::DatasetEvaluation evaluation;
  std::mutex mu;
  va::analyze_batch_parallel(
      pipeline, jobs,
      [&](const std::string& video_id, const va::VerdictOrError& result) {
        std::lock_guard lock(mu);
        if (!result) {
          evaluation.add_error();
          std::cout << video_id << ": error " << vc::to_string(result.error()) << "\n";
          return;
        }
        evaluation.add(truths.at(video_id), result->decision);
        std::cout << video_id << ": " << vc::to_string(result->decision) << " p="
                  << result->probability << "\n";
      },
      workers);

  const auto& m = evaluation.matrix();
  const auto metrics = evaluation.metrics();
  auto pct = [](const std::optional<double>& v) {
    std::ostringstream s;
    if (v) s << std::fixed << std::setprecision(1) << *v * 100.0 << "%";
    else s << "n/a";
    return s.str();
  };
  std::cout << "\nTP=" << m.true_positive << " FP=" << m.false_positive
            << " TN=" << m.true_negative << " FN=" << m.false_negative
            << " errors=" << evaluation.errors() << "\n"
            << "accuracy=" << pct(metrics.accuracy) << " precision=" << pct(metrics.precision)
            << " recall=" << pct(metrics.recall) << " f1=" << pct(metrics.f1) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string features_path;
  std::string faces_dir;
  std::string context_dir;
  std::string dataset_path;
  std::size_t workers = 0;
  double fps = 30.0;
  bool timing = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--features" && i + 1 < argc) {
      features_path = argv[++i];
    } else if (arg == "--faces" && i + 1 < argc) {
      faces_dir = argv[++i];
    } else if (arg == "--contexts" && i + 1 < argc) {
      context_dir = argv[++i];
    } else if (arg == "--dataset" && i + 1 < argc) {
      dataset_path = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      const auto n = parse_number<std::size_t>(argv[++i]);
      if (!n) {
        std::cerr << "--workers expects a non-negative integer (see --help)\n";
        return 1;
      }
      workers = *n;
    } else if (arg == "--fps" && i + 1 < argc) {
      const auto n = parse_number<double>(argv[++i]);
      if (!n || !std::isfinite(*n) || *n <= 0.0) {
        std::cerr << "--fps expects a positive number (see --help)\n";
        return 1;
      }
      fps = *n;
    } else if (arg == "--timing") {
      timing = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: veritas_cli [options]\n"
                << "  --config <path>    Fusion config (key=value file); default: built-in\n"
                << "  --features <csv>   Per-frame features: level,frame_index,timestamp,k=v;k=v\n"
                << "  --faces <dir>      Face crops; texture and color are extracted from them\n"
                << "  --contexts <dir>   Context crops matching --faces file names (color level)\n"
                << "  --fps <n>          Frame rate for --faces timestamps (default 30)\n"
                << "  --dataset <path>   Manifest of <real|fake>,<features.csv> lines; prints metrics\n"
                << "  --workers <n>      Worker threads for --faces / --dataset (0 = all cores)\n"
                << "  --timing           Print per-level timing\n"
                << "\nWithout --features, --faces or --dataset a synthetic demo clip is analyzed.\n";
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << " (see --help)\n";
      return 1;
    }
  }

  auto cfg = config_path.empty() ? va::default_config() : va::load_config(config_path);
  if (!cfg) {
    std::cerr << "Invalid config: " << config_path << "\n";
    return 1;
  }
  auto pipeline = veritas::levels::make_default_pipeline(*cfg);
  if (!pipeline) {
    std::cerr << "Pipeline error: " << vc::to_string(pipeline.error()) << "\n";
    return 1;
  }

  if (!dataset_path.empty()) {
    return run_dataset(*pipeline, dataset_path, workers);
  }

  va::FeatureTable table;
  if (!features_path.empty()) {
    std::size_t bad_line = 0;
    auto loaded = va::read_feature_csv(features_path, &bad_line);
    if (!loaded) {
      std::cerr << "Failed to read features: " << features_path;
      if (bad_line > 0) std::cerr << " (line " << bad_line << ")";
      std::cerr << "\n";
      return 1;
    }
    table = std::move(*loaded);
  }

  std::unique_ptr<vc::ILevelFeatureSource> source;
  if (!faces_dir.empty()) {
    auto image_source = std::make_unique<vv::ImageFeatureSource>(
        load_samples(faces_dir, context_dir, fps), workers);
    for (const auto level : vc::kAllLevels) {
      auto& rows = table[vc::level_index(level)];
      const bool extracted = level == vc::LevelId::Texture || level == vc::LevelId::Color;
      if (!extracted || !rows.empty()) image_source->set_records(level, std::move(rows));
    }
    source = std::move(image_source);
  } else if (!features_path.empty()) {
    source = std::make_unique<va::TableFeatureSource>(std::move(table));
  } else {
    source = std::make_unique<vc::MockFeatureSource>(make_demo_source());
  }

  vc::LevelTimingCallback timing_cb = [](vc::LevelId level, double ms) {
    std::cerr << "  " << vc::to_string(level) << ": " << ms << " ms\n";
  };
  auto verdict = va::analyze_video(*pipeline, *source, timing ? &timing_cb : nullptr);
  if (!verdict) {
    std::cerr << "Analysis failed: " << vc::to_string(verdict.error()) << "\n";
    return 1;
  }

  const std::string text = format_verdict(*verdict);
  std::cout << text;

  if (!features_path.empty()) {
    std::filesystem::path p(features_path);
    std::filesystem::path out_dir("output");
    std::filesystem::create_directories(out_dir);
    std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
    std::ofstream f(out_file);
    if (f) {
      f << text;
    } else {
      std::cerr << "Warning: could not write " << out_file << "\n";
    }
  }
  return 0;
}
