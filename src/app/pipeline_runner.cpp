#include <pillsight/app/pipeline_runner.hpp>
#include <pillsight/vision/load_image.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace pillsight::app {

namespace pc = pillsight::core;

std::expected<pc::CountResult, pc::PipelineError>
run_pipeline(pc::Pipeline& pipeline,
             const pc::Frame& frame,
             StageTimingCallback* timing_cb,
             std::optional<std::string> image_id) {
  auto result = pipeline.run(frame, timing_cb);
  if (result && image_id.has_value()) {
    result->image_id = std::move(image_id);
  }
  return result;
}

std::expected<pc::CountResult, pc::PipelineError>
count_encoded_image(pc::Pipeline& pipeline,
                    std::span<const std::uint8_t> bytes,
                    StageTimingCallback* timing_cb,
                    std::optional<std::string> image_id) {
  auto frame = pillsight::vision::decode_frame(bytes);
  if (!frame) {
    return std::unexpected(frame.error());
  }
  return run_pipeline(pipeline, *frame, timing_cb, std::move(image_id));
}

namespace {

/// Runs one frame and dispatches to the right callback.
void run_one(pc::Pipeline& pipeline,
             const std::vector<pc::Frame>& frames,
             std::size_t i,
             const std::vector<std::string>* image_ids,
             const CountResultCallback& callback,
             const CountErrorCallback& on_error) {
  auto result = pipeline.run(frames[i]);
  if (!result) {
    if (on_error) on_error(i, result.error());
    return;
  }
  if (image_ids && image_ids->size() == frames.size() && !(*image_ids)[i].empty()) {
    result->image_id = (*image_ids)[i];
  }
  if (callback) callback(*result);
}

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_pipeline_batch(pc::Pipeline& pipeline,
                        const std::vector<pc::Frame>& frames,
                        CountResultCallback callback,
                        const std::vector<std::string>* image_ids,
                        CountErrorCallback on_error) {
  for (std::size_t i = 0; i < frames.size(); ++i) {
    run_one(pipeline, frames, i, image_ids, callback, on_error);
  }
}

void run_pipeline_batch_parallel(
    pc::Pipeline& pipeline,
    const std::vector<pc::Frame>& frames,
    CountResultCallback callback,
    std::size_t num_workers,
    const std::vector<std::string>* image_ids,
    CountErrorCallback on_error) {
  const std::size_t n = frames.size();
  if (n == 0 || (!callback && !on_error)) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_pipeline_batch(pipeline, frames, std::move(callback), image_ids, std::move(on_error));
    return;
  }

  // All work is known up front: workers drain the queue and exit when it is empty.
  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      run_one(pipeline, frames, idx, image_ids, callback, on_error);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace pillsight::app
