#include "ridge_texture/run/synthesis_profile.hpp"
#include "ridge_texture/core/types.hpp"

namespace ridge_texture::run {

SynthesisProfile synthesis_profile(const config::Config& cfg) {
    SynthesisProfile p;
    p.version = cfg.pipeline.prompt_version;
    p.description =
        "Local fingerprint texture synthesis: ridge pixels receive achromatic "
        "granular noise, valley pixels are cleaned to pure white, and the result "
        "is sharpened with a fixed 3x3 kernel.";
    p.features = {
        "Ridge/valley classification on the red channel",
        "Achromatic granular micro-texture on ridges",
        "Valley cleaning to pure white (255,255,255)",
        "3x3 sharpening with edge replication",
        "Alpha channel preserved",
        "Deterministic noise for a recorded seed",
        "Structural quality metrics per run",
    };
    p.ridge_threshold = kRidgeThreshold;
    p.noise_half_width = kNoiseHalfWidth;
    p.sharpen_kernel = {0, -1, 0, -1, 5, -1, 0, -1, 0};
    return p;
}

nlohmann::json profile_to_json(const SynthesisProfile& p) {
    return nlohmann::json{
        {"version", p.version},
        {"description", p.description},
        {"features", p.features},
        {"ridgeThreshold", p.ridge_threshold},
        {"noiseHalfWidth", p.noise_half_width},
        {"sharpenKernel", p.sharpen_kernel}
    };
}

} // namespace ridge_texture::run
