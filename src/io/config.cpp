#include "ridge_texture/config/configuration.hpp"
#include "ridge_texture/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace ridge_texture::config {

static void read_float_pair(const YAML::Node& n, std::array<float, 2>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out[0] = n[0].as<float>();
        out[1] = n[1].as<float>();
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["pipeline"]) {
        auto p = node["pipeline"];
        if (p["prompt_version"]) cfg.pipeline.prompt_version = p["prompt_version"].as<std::string>();
    }

    if (node["synthesis"]) {
        auto s = node["synthesis"];
        if (s["seed"]) cfg.synthesis.seed = s["seed"].as<uint64_t>();
    }

    if (node["quality"]) {
        auto q = node["quality"];
        if (q["block_size"]) cfg.quality.block_size = q["block_size"].as<int>();
        read_float_pair(q["ridge_variance_band"], cfg.quality.ridge_variance_band);
        if (q["weights"]) {
            auto w = q["weights"];
            if (w["texture_uniformity"]) cfg.quality.weights.texture_uniformity = w["texture_uniformity"].as<float>();
            if (w["edge_preservation"]) cfg.quality.weights.edge_preservation = w["edge_preservation"].as<float>();
            if (w["contrast_ratio"]) cfg.quality.weights.contrast_ratio = w["contrast_ratio"].as<float>();
            if (w["ridge_clarity"]) cfg.quality.weights.ridge_clarity = w["ridge_clarity"].as<float>();
            if (w["background_cleanness"]) cfg.quality.weights.background_cleanness = w["background_cleanness"].as<float>();
        }
    }

    if (node["runtime_limits"]) {
        auto r = node["runtime_limits"];
        if (r["parallel_workers"]) cfg.runtime_limits.parallel_workers = r["parallel_workers"].as<int>();
    }

    if (node["storage"]) {
        auto s = node["storage"];
        if (s["blob_root"]) cfg.storage.blob_root = s["blob_root"].as<std::string>();
        if (s["public_base_url"]) cfg.storage.public_base_url = s["public_base_url"].as<std::string>();
    }

    if (node["store"]) {
        auto s = node["store"];
        if (s["backend"]) cfg.store.backend = s["backend"].as<std::string>();
        if (s["runs_dir"]) cfg.store.runs_dir = s["runs_dir"].as<std::string>();
    }

    if (node["oracle"]) {
        auto o = node["oracle"];
        if (o["enabled"]) cfg.oracle.enabled = o["enabled"].as<bool>();
        if (o["endpoint"]) cfg.oracle.endpoint = o["endpoint"].as<std::string>();
        if (o["model"]) cfg.oracle.model = o["model"].as<std::string>();
        if (o["api_key_env"]) cfg.oracle.api_key_env = o["api_key_env"].as<std::string>();
        if (o["timeout_ms"]) cfg.oracle.timeout_ms = o["timeout_ms"].as<int>();
    }

    if (node["notifier"]) {
        auto n = node["notifier"];
        if (n["enabled"]) cfg.notifier.enabled = n["enabled"].as<bool>();
        if (n["endpoint"]) cfg.notifier.endpoint = n["endpoint"].as<std::string>();
        if (n["api_key_env"]) cfg.notifier.api_key_env = n["api_key_env"].as<std::string>();
        if (n["timeout_ms"]) cfg.notifier.timeout_ms = n["timeout_ms"].as<int>();
        if (n["perfect_score_threshold"]) {
            cfg.notifier.perfect_score_threshold = n["perfect_score_threshold"].as<float>();
        }
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << to_yaml();
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["prompt_version"] = pipeline.prompt_version;

    node["synthesis"]["seed"] = synthesis.seed;

    node["quality"]["block_size"] = quality.block_size;
    node["quality"]["ridge_variance_band"].push_back(quality.ridge_variance_band[0]);
    node["quality"]["ridge_variance_band"].push_back(quality.ridge_variance_band[1]);
    node["quality"]["weights"]["texture_uniformity"] = quality.weights.texture_uniformity;
    node["quality"]["weights"]["edge_preservation"] = quality.weights.edge_preservation;
    node["quality"]["weights"]["contrast_ratio"] = quality.weights.contrast_ratio;
    node["quality"]["weights"]["ridge_clarity"] = quality.weights.ridge_clarity;
    node["quality"]["weights"]["background_cleanness"] = quality.weights.background_cleanness;

    node["runtime_limits"]["parallel_workers"] = runtime_limits.parallel_workers;

    node["storage"]["blob_root"] = storage.blob_root;
    node["storage"]["public_base_url"] = storage.public_base_url;

    node["store"]["backend"] = store.backend;
    node["store"]["runs_dir"] = store.runs_dir;

    node["oracle"]["enabled"] = oracle.enabled;
    node["oracle"]["endpoint"] = oracle.endpoint;
    node["oracle"]["model"] = oracle.model;
    node["oracle"]["api_key_env"] = oracle.api_key_env;
    node["oracle"]["timeout_ms"] = oracle.timeout_ms;

    node["notifier"]["enabled"] = notifier.enabled;
    node["notifier"]["endpoint"] = notifier.endpoint;
    node["notifier"]["api_key_env"] = notifier.api_key_env;
    node["notifier"]["timeout_ms"] = notifier.timeout_ms;
    node["notifier"]["perfect_score_threshold"] = notifier.perfect_score_threshold;

    return node;
}

void Config::validate() const {
    if (pipeline.prompt_version.empty()) {
        throw ValidationError("pipeline.prompt_version must not be empty");
    }

    {
        const auto& w = quality.weights;
        const float ws[] = {w.texture_uniformity, w.edge_preservation, w.contrast_ratio,
                            w.ridge_clarity, w.background_cleanness};
        for (float v : ws) {
            if (v < 0.0f || v > 1.0f) {
                throw ValidationError("quality.weights.* must be between 0 and 1");
            }
        }
        const float sum = ws[0] + ws[1] + ws[2] + ws[3] + ws[4];
        if (std::fabs(sum - 1.0f) > 1.0e-3f) {
            throw ValidationError("quality.weights.* must sum to 1.0");
        }
    }
    if (quality.block_size < 2 || quality.block_size > 512) {
        throw ValidationError("quality.block_size must be in [2,512]");
    }
    if (quality.ridge_variance_band[0] <= 0.0f ||
        quality.ridge_variance_band[0] >= quality.ridge_variance_band[1]) {
        throw ValidationError("quality.ridge_variance_band must be [lo,hi] with 0 < lo < hi");
    }

    if (runtime_limits.parallel_workers < 1 || runtime_limits.parallel_workers > 256) {
        throw ValidationError("runtime_limits.parallel_workers must be in [1,256]");
    }

    if (storage.blob_root.empty()) {
        throw ValidationError("storage.blob_root must not be empty");
    }

    if (store.backend != "file" && store.backend != "memory") {
        throw ValidationError("store.backend must be 'file' or 'memory'");
    }
    if (store.backend == "file" && store.runs_dir.empty()) {
        throw ValidationError("store.runs_dir must not be empty for the file backend");
    }

    if (oracle.enabled && oracle.endpoint.empty()) {
        throw ValidationError("oracle.endpoint is required when oracle.enabled is true");
    }
    if (oracle.timeout_ms < 1) {
        throw ValidationError("oracle.timeout_ms must be >= 1");
    }

    if (notifier.enabled && notifier.endpoint.empty()) {
        throw ValidationError("notifier.endpoint is required when notifier.enabled is true");
    }
    if (notifier.timeout_ms < 1) {
        throw ValidationError("notifier.timeout_ms must be >= 1");
    }
    if (notifier.perfect_score_threshold < 0.0f || notifier.perfect_score_threshold > 1.0f) {
        throw ValidationError("notifier.perfect_score_threshold must be in [0,1]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "pipeline": {
      "type": "object",
      "properties": {
        "prompt_version": {"type": "string", "minLength": 1}
      }
    },
    "synthesis": {
      "type": "object",
      "properties": {
        "seed": {"type": "integer", "minimum": 0}
      }
    },
    "quality": {
      "type": "object",
      "properties": {
        "block_size": {"type": "integer", "minimum": 2, "maximum": 512},
        "ridge_variance_band": {"type": "array", "items": {"type": "number"}, "minItems": 2, "maxItems": 2},
        "weights": {
          "type": "object",
          "properties": {
            "texture_uniformity": {"type": "number", "minimum": 0, "maximum": 1},
            "edge_preservation": {"type": "number", "minimum": 0, "maximum": 1},
            "contrast_ratio": {"type": "number", "minimum": 0, "maximum": 1},
            "ridge_clarity": {"type": "number", "minimum": 0, "maximum": 1},
            "background_cleanness": {"type": "number", "minimum": 0, "maximum": 1}
          }
        }
      }
    },
    "runtime_limits": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 256}
      }
    },
    "storage": {
      "type": "object",
      "properties": {
        "blob_root": {"type": "string", "minLength": 1},
        "public_base_url": {"type": "string"}
      }
    },
    "store": {
      "type": "object",
      "properties": {
        "backend": {"type": "string", "enum": ["file", "memory"]},
        "runs_dir": {"type": "string"}
      }
    },
    "oracle": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "endpoint": {"type": "string"},
        "model": {"type": "string"},
        "api_key_env": {"type": "string"},
        "timeout_ms": {"type": "integer", "minimum": 1}
      }
    },
    "notifier": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "endpoint": {"type": "string"},
        "api_key_env": {"type": "string"},
        "timeout_ms": {"type": "integer", "minimum": 1},
        "perfect_score_threshold": {"type": "number", "minimum": 0, "maximum": 1}
      }
    }
  }
})";
}

} // namespace ridge_texture::config
