#pragma once

#include "diffmap/core/types.hpp"
#include "diffmap/diff/classifier.hpp"
#include "diffmap/diff/grouper.hpp"
#include "diffmap/render/render_graph.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace diffmap::config {

namespace fs = std::filesystem;

struct ClassifyConfig {
  double changed_min_distance = 40.0;
  double antialias_min_distance = 12.0;
  double antialias_max_distance = 150.0;
  double background_max_contrast = 25.0;
  bool include_foreground = true;
  bool include_background = false;
  bool include_antialias = false;
};

struct GroupConfig {
  int merge_max_gap_size = 80;
  int border_size = 15;
  int padding_size = 80;
};

struct StatusConfig {
  double mismatch_min_percent = 50.0; // percent of all pixels
};

struct OutputConfig {
  std::vector<std::string> names = {"groups"};
  std::vector<std::string> render_when_status = {"different", "mismatch"}; // or "all"
  render::RenderOptions options; // overrides for program defaults
};

struct Config {
  ClassifyConfig classify;
  GroupConfig group;
  StatusConfig status;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  diff::ClassifyOptions classify_options() const;
  diff::GroupOptions group_options() const;
  bool should_render(DiffStatus status) const;
};

std::string get_schema_json();

} // namespace diffmap::config
