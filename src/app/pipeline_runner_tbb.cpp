#include <pillsight/app/pipeline_runner_tbb.hpp>

#ifdef PILLSIGHT_HAS_TBB

#include <pillsight/core/count_result.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace pillsight::app {

void run_pipeline_batch_tbb(
    pillsight::core::Pipeline& pipeline,
    const std::vector<std::pair<std::string, pillsight::core::Frame>>& work_items,
    CountResultCallback callback,
    CountErrorCallback on_error) {
  if (work_items.empty() || (!callback && !on_error)) return;

  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          auto result = pipeline.run(work_items[i].second);
          if (!result) {
            if (on_error) on_error(i, result.error());
            continue;
          }
          result->image_id = work_items[i].first;
          if (callback) callback(*result);
        }
      });
}

}  // namespace pillsight::app

#endif  // PILLSIGHT_HAS_TBB
