#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace ridge_texture::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  // Traceability tag stored on every run record.
  std::string prompt_version = "v5.0-VALLEY-CLEANING";
};

struct SynthesisConfig {
  uint64_t seed = 0; // 0 = derive a fresh seed per run
};

struct QualityConfig {
  struct Weights {
    float texture_uniformity = 0.2f;
    float edge_preservation = 0.2f;
    float contrast_ratio = 0.2f;
    float ridge_clarity = 0.2f;
    float background_cleanness = 0.2f;
  } weights;
  int block_size = 16;
  std::array<float, 2> ridge_variance_band{16.0f, 2500.0f};
};

struct RuntimeLimitsConfig {
  int parallel_workers = 4;
};

struct StorageConfig {
  std::string blob_root = "blobs";
  std::string public_base_url; // empty = file:// URLs
};

struct StoreConfig {
  std::string backend = "file"; // file | memory
  std::string runs_dir = "runs";
};

struct OracleConfig {
  bool enabled = false;
  std::string endpoint;
  std::string model = "vision-default";
  std::string api_key_env = "RIDGE_TEXTURE_ORACLE_KEY";
  int timeout_ms = 60000;
};

struct NotifierConfig {
  bool enabled = false;
  std::string endpoint;
  std::string api_key_env = "RIDGE_TEXTURE_NOTIFY_KEY";
  int timeout_ms = 10000;
  float perfect_score_threshold = 0.95f;
};

struct Config {
  PipelineConfig pipeline;
  SynthesisConfig synthesis;
  QualityConfig quality;
  RuntimeLimitsConfig runtime_limits;
  StorageConfig storage;
  StoreConfig store;
  OracleConfig oracle;
  NotifierConfig notifier;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace ridge_texture::config
