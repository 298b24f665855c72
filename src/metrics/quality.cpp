#include "ridge_texture/metrics/quality.hpp"
#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/utils.hpp"
#include "ridge_texture/image/classifier.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace ridge_texture::metrics {

namespace {

using MaskArray = Eigen::Array<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

double clamp01(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::min(1.0, std::max(0.0, v));
}

Matrix2Df red_plane(const image::RgbaImage& img) {
    Matrix2Df out(img.height, img.width);
    for (int y = 0; y < img.height; ++y) {
        for (int x = 0; x < img.width; ++x) {
            out(y, x) = static_cast<float>(img.pixel(x, y)[0]);
        }
    }
    return out;
}

double background_cleanness(const image::RgbaImage& processed, const ClassMap& classes) {
    size_t valley = 0;
    size_t clean = 0;
    for (int y = 0; y < processed.height; ++y) {
        for (int x = 0; x < processed.width; ++x) {
            if (classes.at(x, y) != PixelClass::Valley) continue;
            ++valley;
            const uint8_t* px = processed.pixel(x, y);
            if (px[0] == 255 && px[1] == 255 && px[2] == 255) {
                ++clean;
            }
        }
    }
    if (valley == 0) return 1.0;
    return static_cast<double>(clean) / static_cast<double>(valley);
}

double ridge_clarity(double variance, bool has_ridges, const std::array<float, 2>& band) {
    if (!has_ridges) return 0.0;
    const double lo = band[0];
    const double hi = band[1];
    if (variance > hi) return hi / variance;
    if (variance < lo) return variance / lo;
    return 1.0;
}

double edge_preservation(const ClassMap& orig, const image::RgbaImage& processed) {
    size_t boundary = 0;
    size_t kept = 0;
    const int w = orig.width;
    const int h = orig.height;
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const PixelClass c = orig.at(x, y);
            const bool is_boundary =
                (x > 0 && orig.at(x - 1, y) != c) || (x + 1 < w && orig.at(x + 1, y) != c) ||
                (y > 0 && orig.at(x, y - 1) != c) || (y + 1 < h && orig.at(x, y + 1) != c);
            if (!is_boundary) continue;
            ++boundary;
            if (classify_intensity(processed.pixel(x, y)[0]) == c) {
                ++kept;
            }
        }
    }
    if (boundary == 0) return 1.0;
    return static_cast<double>(kept) / static_cast<double>(boundary);
}

double texture_uniformity(const Matrix2Df& intensity, const MaskArray& ridge_mask, int block) {
    std::vector<float> block_sigmas;
    const int h = static_cast<int>(intensity.rows());
    const int w = static_cast<int>(intensity.cols());
    for (int by = 0; by < h; by += block) {
        for (int bx = 0; bx < w; bx += block) {
            const int bh = std::min(block, h - by);
            const int bw = std::min(block, w - bx);
            const MaskArray m = ridge_mask.block(by, bx, bh, bw);
            const float n = m.sum();
            if (n < 4.0f) continue;
            const Matrix2Df tile = intensity.block(by, bx, bh, bw);
            const auto v = tile.array();
            const float mean = (v * m).sum() / n;
            const float var = ((v - mean).square() * m).sum() / n;
            block_sigmas.push_back(std::sqrt(std::max(0.0f, var)));
        }
    }
    if (block_sigmas.size() < 2) return 1.0;

    double mean = 0.0;
    for (float s : block_sigmas) mean += s;
    mean /= static_cast<double>(block_sigmas.size());
    if (mean <= 1.0e-9) return 1.0;
    const double cv = static_cast<double>(core::stddev_of(block_sigmas)) / mean;
    return 1.0 - std::min(1.0, cv);
}

} // namespace

QualityMetrics score_quality(const image::RgbaImage& original,
                             const image::RgbaImage& processed,
                             const config::QualityConfig& cfg) {
    if (cfg.block_size < 1) {
        throw ValidationError("quality.block_size must be >= 1");
    }
    if (!(cfg.ridge_variance_band[0] > 0.0f) ||
        !(cfg.ridge_variance_band[0] < cfg.ridge_variance_band[1])) {
        throw ValidationError("quality.ridge_variance_band must be [lo,hi] with 0 < lo < hi");
    }
    original.validate();
    processed.validate();
    if (original.width != processed.width || original.height != processed.height) {
        throw SynthesisError("processed image does not match original dimensions");
    }

    const ClassMap classes = image::classify_pixels(original);
    const Matrix2Df intensity = red_plane(processed);

    MaskArray ridge_mask(original.height, original.width);
    for (int y = 0; y < original.height; ++y) {
        for (int x = 0; x < original.width; ++x) {
            ridge_mask(y, x) = classes.at(x, y) == PixelClass::Ridge ? 1.0f : 0.0f;
        }
    }
    const MaskArray valley_mask = 1.0f - ridge_mask;

    const double n_ridge = ridge_mask.sum();
    const double n_valley = valley_mask.sum();
    const auto v = intensity.array();

    double ridge_mean = 0.0;
    double ridge_var = 0.0;
    if (n_ridge > 0.0) {
        ridge_mean = (v * ridge_mask).sum() / n_ridge;
        ridge_var = ((v - static_cast<float>(ridge_mean)).square() * ridge_mask).sum() / n_ridge;
    }
    const double valley_mean = n_valley > 0.0 ? (v * valley_mask).sum() / n_valley : 0.0;

    QualityMetrics m;
    m.background_cleanness = clamp01(background_cleanness(processed, classes));
    m.ridge_clarity = clamp01(ridge_clarity(ridge_var, n_ridge > 0.0, cfg.ridge_variance_band));
    m.contrast_ratio = (n_ridge > 0.0 && n_valley > 0.0)
                           ? clamp01((valley_mean - ridge_mean) / 255.0)
                           : 0.0;
    m.edge_preservation = clamp01(edge_preservation(classes, processed));
    m.texture_uniformity = clamp01(texture_uniformity(intensity, ridge_mask, cfg.block_size));

    const auto& w = cfg.weights;
    m.overall_score = clamp01(w.texture_uniformity * m.texture_uniformity +
                              w.edge_preservation * m.edge_preservation +
                              w.contrast_ratio * m.contrast_ratio +
                              w.ridge_clarity * m.ridge_clarity +
                              w.background_cleanness * m.background_cleanness);
    return m;
}

} // namespace ridge_texture::metrics
