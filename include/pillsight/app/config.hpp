#pragma once

#include <pillsight/vision/binarizer.hpp>
#include <pillsight/vision/candidate_filter.hpp>
#include <pillsight/vision/channel_normalizer.hpp>
#include <pillsight/vision/region_selector.hpp>
#include <pillsight/vision/reporter.hpp>
#include <pillsight/vision/separator.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace pillsight::app {

/// Pipeline configuration: one immutable block per stage.
struct PipelineConfig {
  pillsight::vision::RegionConfig region;
  pillsight::vision::NormalizeConfig normalize;
  pillsight::vision::BinarizeConfig binarize;
  pillsight::vision::SeparateConfig separate;
  pillsight::vision::FilterConfig filter;
  pillsight::vision::ReportConfig report;
};

/// Which option is wrong and why.
struct ConfigIssue {
  std::string key;
  std::string reason;
};

/// Default config when no file is provided (circular spotlight, green channel, Otsu, peaks).
PipelineConfig default_config();

/// Load config from a simple key=value file (one per line, '#' comments) on top of the defaults.
[[nodiscard]] std::expected<PipelineConfig, ConfigIssue> load_config(const std::string& path);

/// Set one option by its dotted name, e.g. ("separate.tau", "0.4").
[[nodiscard]] std::expected<void, ConfigIssue> apply_config_value(PipelineConfig& config,
                                                                  std::string_view key,
                                                                  std::string_view value);

/// Check every option against its domain and the strategies against each other.
[[nodiscard]] std::expected<void, ConfigIssue> validate_config(const PipelineConfig& config);

}  // namespace pillsight::app
