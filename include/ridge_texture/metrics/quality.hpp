#pragma once

#include "ridge_texture/config/configuration.hpp"
#include "ridge_texture/core/types.hpp"
#include "ridge_texture/image/rgba_image.hpp"

namespace ridge_texture::metrics {

// Structural quality metrics of a processed image against its original.
// Pixel classes come from the original; processed intensity is the red
// channel. Every field is in [0,1] and depends only on the two images and
// `cfg`.
//
//   background_cleanness  valley pixels that are exactly (255,255,255)
//   ridge_clarity         ridge variance against cfg.ridge_variance_band
//   contrast_ratio        (mean valley - mean ridge) / 255
//   edge_preservation     boundary pixels that keep their class
//   texture_uniformity    1 - CV of per-block ridge standard deviations
//   overall_score         weighted mean with cfg.weights
//
// Throws ValidationError for a block size below 1 or a variance band that is
// not 0 < lo < hi, and SynthesisError if the dimensions differ.
QualityMetrics score_quality(const image::RgbaImage& original,
                             const image::RgbaImage& processed,
                             const config::QualityConfig& cfg);

} // namespace ridge_texture::metrics
