#pragma once

#include "photo_restore/core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace photo_restore::config {

namespace fs = std::filesystem;

struct PathsConfig {
  std::string project_root;  // empty: current working directory
  std::string default_output_folder = "output_gui";
};

struct WorkerConfig {
  std::string interpreter = "python3";
  std::string entry_script = "run.py";
  std::string unbuffered_env = "PYTHONUNBUFFERED";
};

struct DefaultsConfig {
  std::string gpu = "-1";
  bool with_scratch = true;
  bool hr = false;

  // Defaults with any explicitly given values laid over them.
  RunOptions apply(const std::optional<std::string> &gpu, std::optional<bool> with_scratch,
                   std::optional<bool> hr) const;
};

struct RuntimeConfig {
  int poll_interval_ms = 200;
};

struct LoggingConfig {
  std::string event_log;  // empty: no event log file
};

struct Config {
  PathsConfig paths;
  WorkerConfig worker;
  DefaultsConfig defaults;
  RuntimeConfig runtime;
  LoggingConfig logging;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  fs::path resolved_project_root() const;
};

} // namespace photo_restore::config
