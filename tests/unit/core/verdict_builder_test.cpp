#include <veritas/core/verdict_builder.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace vc = veritas::core;

namespace {

vc::LevelResult evaluated(vc::LevelId level, double score) {
  vc::LevelResult r;
  r.level = level;
  r.status = vc::LevelStatus::Evaluated;
  r.score = score;
  r.support = 15;
  return r;
}

}  // namespace

TEST(VerdictBuilder, PlacesResultsByLevelAndFillsNotRun) {
  std::vector<vc::LevelResult> results{
      evaluated(vc::LevelId::Texture, 0.4),
      evaluated(vc::LevelId::Expression, 0.2),
  };
  vc::FusionOutcome fusion;
  fusion.probability = 0.33;
  fusion.effective_weights[vc::level_index(vc::LevelId::Texture)] = 0.75;
  fusion.effective_weights[vc::level_index(vc::LevelId::Expression)] = 0.25;
  vc::EscalationState state;
  state.levels_run = {vc::LevelId::Expression, vc::LevelId::Texture};
  state.conclusive = true;
  state.reason = vc::EscalationReason::AllLevelsExhausted;

  auto v = vc::build_verdict(fusion, vc::Decision::Genuine, state, results);
  ASSERT_EQ(v.level_results.size(), vc::kLevelCount);
  for (std::size_t i = 0; i < vc::kLevelCount; ++i) {
    EXPECT_EQ(v.level_results[i].level, vc::level_at(i));
  }
  EXPECT_EQ(v.level_results[0].status, vc::LevelStatus::Evaluated);
  EXPECT_EQ(v.level_results[1].status, vc::LevelStatus::NotRun);
  EXPECT_FALSE(v.level_results[1].score.has_value());
  EXPECT_EQ(v.level_results[3].status, vc::LevelStatus::Evaluated);
  EXPECT_DOUBLE_EQ(v.level_results[3].detail.metrics.at("effective_weight"), 0.75);
  EXPECT_DOUBLE_EQ(v.probability, 0.33);
  EXPECT_EQ(v.decision, vc::Decision::Genuine);
  EXPECT_EQ(v.reason, vc::EscalationReason::AllLevelsExhausted);
  EXPECT_EQ(v.levels_run, state.levels_run);
}

TEST(VerdictBuilder, CopiesTriggeredFlagsAndReason) {
  vc::FusionOutcome fusion;
  fusion.probability = 0.9;
  fusion.triggered_flags = {vc::LevelId::Expression};
  vc::EscalationState state;
  state.levels_run = {vc::LevelId::Expression};
  state.conclusive = true;
  state.reason = vc::EscalationReason::ConfidentFake;
  std::vector<vc::LevelResult> results{evaluated(vc::LevelId::Expression, 0.9)};

  auto v = vc::build_verdict(fusion, vc::Decision::Deepfake, state, results);
  EXPECT_EQ(v.reason, vc::EscalationReason::ConfidentFake);
  EXPECT_EQ(v.triggered_flags.count(vc::LevelId::Expression), 1u);
  EXPECT_EQ(v.decision, vc::Decision::Deepfake);
}

TEST(VerdictBuilder, FailedLevelKeepsItsNotesWithoutWeight) {
  vc::FusionOutcome fusion;
  fusion.probability = 0.5;
  vc::EscalationState state;
  auto failed = vc::LevelResult::without_evidence(
      vc::LevelId::Blink, vc::LevelStatus::ExtractionFailed, "extraction_error: no eyes");
  std::vector<vc::LevelResult> results{failed};

  auto v = vc::build_verdict(fusion, vc::Decision::Suspicious, state, results);
  const auto& blink = v.level_results[vc::level_index(vc::LevelId::Blink)];
  EXPECT_EQ(blink.status, vc::LevelStatus::ExtractionFailed);
  EXPECT_EQ(blink.detail.metrics.count("effective_weight"), 0u);
  ASSERT_EQ(blink.detail.notes.size(), 1u);
  EXPECT_EQ(blink.detail.notes[0], "extraction_error: no eyes");
}
