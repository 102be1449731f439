/**
 * pillsight-cli: count pills in photograph(s); print counts, optionally write annotated images.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/pillsight_cli [--config path] [--set key=value]... --input photo.jpg [--output dir]
 * With --output: writes <stem>_annotated.png, one <stem>_<stage>.png per debug image and <stem>.txt.
 */

#include <pillsight/app/config.hpp>
#include <pillsight/app/pipeline_builder.hpp>
#include <pillsight/app/pipeline_runner.hpp>
#include <pillsight/core/count_result.hpp>
#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <pillsight/core/pipeline.hpp>
#include <pillsight/vision/load_image.hpp>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace {

constexpr int kExitRuntime = 1;
constexpr int kExitConfig = 2;

void print_usage() {
  std::cout << "Usage: pillsight_cli [options] --input <image> [--input <image> ...]\n"
            << "  --config <path>     Pipeline config (key=value file); default: built-in spotlight\n"
            << "  --set <key=value>   Override one option, e.g. --set separate.tau=0.4 (repeatable)\n"
            << "  --input <path>      Photograph to count (repeatable)\n"
            << "  --output <dir>      Write annotated/debug images and a text report per input\n"
            << "  --workers <n>       Worker threads for several inputs (0 = hardware concurrency)\n"
            << "  --timings           Print per-stage timings (single input)\n"
            << "\nExit codes: 0 ok, 1 decode/processing failure, 2 invalid configuration.\n";
}

std::string report_text(const pillsight::core::CountResult& r) {
  std::ostringstream out;
  out << r.image_id.value_or("<image>") << ": count=" << r.count;
  if (!r.metadata.empty()) out << " (" << r.metadata << ")";
  out << "\n";
  for (const auto& d : r.detections) {
    const auto& c = d.candidate;
    out << "  #" << d.index << " at (" << c.centroid.x << "," << c.centroid.y
        << ") area=" << c.area;
    if (c.radius) out << " radius=" << *c.radius;
    if (c.circularity) out << " circularity=" << *c.circularity;
    out << "\n";
  }
  return out.str();
}

/// Writes a Frame through OpenCV's encoder; returns false on failure.
bool write_frame(const std::filesystem::path& path, const pillsight::core::Frame& frame) {
  int type = -1;
  switch (frame.format()) {
    case pillsight::core::PixelFormat::Grayscale8:
      type = CV_8UC1;
      break;
    case pillsight::core::PixelFormat::BGR8:
      type = CV_8UC3;
      break;
    default:
      return false;
  }
  const cv::Mat view(static_cast<int>(frame.height()), static_cast<int>(frame.width()), type,
                     const_cast<std::byte*>(frame.data().data()));
  try {
    return cv::imwrite(path.string(), view);
  } catch (const cv::Exception&) {
    return false;
  }
}

void write_outputs(const std::filesystem::path& out_dir,
                   const std::string& input_path,
                   const pillsight::core::CountResult& r,
                   const std::string& text) {
  const std::string stem = std::filesystem::path(input_path).stem().string();
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "Warning: could not create " << out_dir << ": " << ec.message() << "\n";
    return;
  }

  if (!write_frame(out_dir / (stem + "_annotated.png"), r.annotated)) {
    std::cerr << "Warning: could not write annotated image for " << input_path << "\n";
  }
  for (const auto& dbg : r.debug_images) {
    if (dbg.image && !write_frame(out_dir / (stem + "_" + dbg.name + ".png"), *dbg.image)) {
      std::cerr << "Warning: could not write debug image " << dbg.name << "\n";
    }
  }
  std::ofstream f(out_dir / (stem + ".txt"));
  if (f) {
    f << text;
  } else {
    std::cerr << "Warning: could not write " << (out_dir / (stem + ".txt")) << "\n";
  }
}

void report(const pillsight::core::CountResult& r,
            const std::string& input_path,
            const std::string& output_dir) {
  const std::string text = report_text(r);
  std::cout << text;
  if (r.has_warning(pillsight::core::PipelineWarning::NoDetections)) {
    std::cerr << "Warning: no pills detected in " << input_path << "\n";
  }
  if (!output_dir.empty()) {
    write_outputs(output_dir, input_path, r, text);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> overrides;
  std::vector<std::string> inputs;
  std::string output_dir;
  std::size_t workers = 0;
  bool timings = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--set" && i + 1 < argc) {
      overrides.emplace_back(argv[++i]);
    } else if (arg == "--input" && i + 1 < argc) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--output" && i + 1 < argc) {
      output_dir = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      try {
        workers = static_cast<std::size_t>(std::stoul(argv[++i]));
      } catch (const std::exception&) {
        std::cerr << "Invalid --workers value\n";
        return kExitConfig;
      }
    } else if (arg == "--timings") {
      timings = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return kExitConfig;
    }
  }

  if (inputs.empty()) {
    print_usage();
    return kExitConfig;
  }

  pillsight::app::PipelineConfig cfg = pillsight::app::default_config();
  if (!config_path.empty()) {
    auto loaded = pillsight::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Config error: " << loaded.error().key << ": " << loaded.error().reason << "\n";
      return kExitConfig;
    }
    cfg = *loaded;
  }
  for (const auto& kv : overrides) {
    const auto pos = kv.find('=');
    if (pos == std::string::npos) {
      std::cerr << "Config error: --set expects key=value, got " << kv << "\n";
      return kExitConfig;
    }
    auto applied = pillsight::app::apply_config_value(cfg, kv.substr(0, pos), kv.substr(pos + 1));
    if (!applied) {
      std::cerr << "Config error: " << applied.error().key << ": " << applied.error().reason << "\n";
      return kExitConfig;
    }
  }
  if (auto valid = pillsight::app::validate_config(cfg); !valid) {
    std::cerr << "Config error: " << valid.error().key << ": " << valid.error().reason << "\n";
    return kExitConfig;
  }

  auto pipeline = pillsight::app::build_pipeline(cfg);
  if (!pipeline) {
    std::cerr << "Pipeline error: " << pillsight::core::to_string(pipeline.error()) << "\n";
    return kExitConfig;
  }

  if (inputs.size() == 1) {
    const std::string& path = inputs.front();
    auto frame = pillsight::vision::load_frame_from_image(path);
    if (!frame) {
      std::cerr << "Failed to decode image: " << path << "\n";
      return kExitRuntime;
    }
    pillsight::app::StageTimingCallback timing_cb = [](std::size_t idx, double ms) {
      std::cerr << "  stage " << idx << ": " << ms << " ms\n";
    };
    auto result = pillsight::app::run_pipeline(*pipeline, *frame, timings ? &timing_cb : nullptr,
                                               path);
    if (!result) {
      std::cerr << "Pipeline error: " << pillsight::core::to_string(result.error()) << "\n";
      return kExitRuntime;
    }
    report(*result, path, output_dir);
    return 0;
  }

  // Several inputs: decode up front, then count in parallel.
  std::vector<pillsight::core::Frame> frames;
  std::vector<std::string> ids;
  int exit_code = 0;
  for (const auto& path : inputs) {
    auto frame = pillsight::vision::load_frame_from_image(path);
    if (!frame) {
      std::cerr << "Failed to decode image: " << path << "\n";
      exit_code = kExitRuntime;
      continue;
    }
    frames.push_back(std::move(*frame));
    ids.push_back(path);
  }

  std::mutex out_mutex;
  pillsight::app::run_pipeline_batch_parallel(
      *pipeline, frames,
      [&](const pillsight::core::CountResult& r) {
        std::lock_guard lock(out_mutex);
        report(r, r.image_id.value_or(""), output_dir);
      },
      workers, &ids,
      [&](std::size_t idx, pillsight::core::PipelineError err) {
        std::lock_guard lock(out_mutex);
        std::cerr << "Pipeline error for " << ids[idx] << ": "
                  << pillsight::core::to_string(err) << "\n";
        exit_code = kExitRuntime;
      });
  return exit_code;
}
