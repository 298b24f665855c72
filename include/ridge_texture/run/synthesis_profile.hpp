#pragma once

#include "ridge_texture/config/configuration.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ridge_texture::run {

// Human-readable description of the processing a run applies, keyed by the
// prompt version stored on each record.
struct SynthesisProfile {
    std::string version;
    std::string description;
    std::vector<std::string> features;
    int ridge_threshold = 0;
    int noise_half_width = 0;
    std::vector<int> sharpen_kernel;
};

SynthesisProfile synthesis_profile(const config::Config& cfg);

nlohmann::json profile_to_json(const SynthesisProfile& p);

} // namespace ridge_texture::run
