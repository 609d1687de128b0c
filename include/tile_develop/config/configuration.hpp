#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace tile_develop::config {

namespace fs = std::filesystem;

struct BackendConfig {
  std::string name = "cpu"; // cpu | opencv | opencl
  int worker_threads = 4;
};

struct TilesConfig {
  int tile_size = 1024;
  int min_tile_size = 128; // floor for the out-of-memory retry
  // Extra full-resolution margin computed around each tile beyond the halo.
  // Cached outputs keep it, so edits that add up to this much spatial
  // footprint downstream still reuse them.
  int reserve_margin = 32;
};

struct CacheConfig {
  bool enabled = true;
  int memory_budget_mb = 512;
};

struct DeviceConfig {
  // Shared by tile working buffers and cache entries.
  int memory_budget_mb = 1024;
};

struct HistoryConfig {
  int coalesce_window_ms = 400;
  int max_entries = 500; // 0 = unbounded
};

struct PreviewConfig {
  bool enabled = true;
  int max_edge = 1024;
};

struct NumericConfig {
  float hdr_sample_max = 65504.0f; // fp16 max
};

struct Config {
  BackendConfig backend;
  TilesConfig tiles;
  CacheConfig cache;
  DeviceConfig device;
  HistoryConfig history;
  PreviewConfig preview;
  NumericConfig numeric;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace tile_develop::config
