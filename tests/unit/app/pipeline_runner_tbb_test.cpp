#ifdef PILLSIGHT_HAS_TBB

#include <pillsight/app/config.hpp>
#include <pillsight/app/pipeline_builder.hpp>
#include <pillsight/app/pipeline_runner_tbb.hpp>
#include <pillsight/core/count_result.hpp>
#include <pillsight/core/frame.hpp>
#include <pillsight/core/pipeline.hpp>
#include "support/synthetic.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace {

pillsight::core::Pipeline make_counting_pipeline() {
  auto cfg = pillsight::app::default_config();
  cfg.region.shape = pillsight::core::RegionShape::Rect;
  cfg.region.extent = 1.0;
  cfg.normalize.contrast_enabled = false;
  return std::move(*pillsight::app::build_pipeline(cfg));
}

}  // namespace

TEST(PipelineRunnerTbbTest, RunsCallbackPerWorkItem) {
  pillsight::core::Pipeline pipeline = make_counting_pipeline();
  std::vector<std::pair<std::string, pillsight::core::Frame>> work_items;
  work_items.emplace_back("tray_1", pillsight::testing::two_disc_scene(100, 200));
  work_items.emplace_back("tray_2", pillsight::testing::two_disc_scene(90, 210));
  work_items.emplace_back("tray_3", pillsight::testing::two_disc_scene(125, 175));

  std::atomic<std::size_t> call_count{0};
  std::vector<std::string> ids;
  std::mutex mutex;
  pillsight::app::run_pipeline_batch_tbb(
      pipeline, work_items,
      [&](const pillsight::core::CountResult& r) {
        call_count++;
        EXPECT_EQ(r.count, 2u);
        std::lock_guard lock(mutex);
        ids.push_back(r.image_id.value_or(""));
      });
  EXPECT_EQ(call_count.load(), 3u);
  std::sort(ids.begin(), ids.end());
  EXPECT_EQ(ids, (std::vector<std::string>{"tray_1", "tray_2", "tray_3"}));
}

TEST(PipelineRunnerTbbTest, FailedItemReportedByIndex) {
  pillsight::core::Pipeline pipeline = make_counting_pipeline();
  std::vector<std::pair<std::string, pillsight::core::Frame>> work_items;
  work_items.emplace_back("good", pillsight::testing::two_disc_scene(100, 200));
  work_items.emplace_back("broken", pillsight::core::Frame{});

  std::atomic<std::size_t> ok{0};
  std::atomic<std::size_t> failed_index{99};
  pillsight::app::run_pipeline_batch_tbb(
      pipeline, work_items,
      [&](const pillsight::core::CountResult&) { ok++; },
      [&](std::size_t i, pillsight::core::PipelineError e) {
        EXPECT_EQ(e, pillsight::core::PipelineError::InvalidFrame);
        failed_index = i;
      });
  EXPECT_EQ(ok.load(), 1u);
  EXPECT_EQ(failed_index.load(), 1u);
}

TEST(PipelineRunnerTbbTest, EmptyWorkItemsDoesNotCallCallback) {
  pillsight::core::Pipeline pipeline = make_counting_pipeline();
  std::vector<std::pair<std::string, pillsight::core::Frame>> work_items;
  std::atomic<std::size_t> calls{0};
  pillsight::app::run_pipeline_batch_tbb(
      pipeline, work_items,
      [&calls](const pillsight::core::CountResult&) { calls++; });
  EXPECT_EQ(calls.load(), 0u);
}

#endif  // PILLSIGHT_HAS_TBB
