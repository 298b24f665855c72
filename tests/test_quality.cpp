#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/image/classifier.hpp"
#include "ridge_texture/image/sharpen.hpp"
#include "ridge_texture/image/texture_synthesis.hpp"
#include "ridge_texture/metrics/quality.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ridge_texture::QualityMetrics;
using ridge_texture::config::QualityConfig;
using ridge_texture::image::RgbaImage;
using ridge_texture::metrics::score_quality;

namespace {

RgbaImage process(const RgbaImage &src, uint64_t seed) {
    using namespace ridge_texture::image;
    const auto classes = classify_pixels(src);
    return sharpen(synthesize_texture(src, classes, seed, 2));
}

void require_in_unit_range(const QualityMetrics &m) {
    for (double v : {m.texture_uniformity, m.edge_preservation, m.contrast_ratio, m.ridge_clarity,
                     m.background_cleanness, m.overall_score}) {
        REQUIRE(v >= 0.0);
        REQUIRE(v <= 1.0);
    }
}

} // namespace

TEST_CASE("quality_of_pipeline_output_has_clean_background") {
    const RgbaImage src = ridge_texture::testing::stripes(64, 64, 4, 4, 50);
    const QualityMetrics m = score_quality(src, process(src, 3), QualityConfig{});

    require_in_unit_range(m);
    REQUIRE(m.background_cleanness == Catch::Approx(1.0));
    REQUIRE(m.contrast_ratio > 0.5);
}

TEST_CASE("quality_all_white_image_has_no_ridge_metrics") {
    const RgbaImage src = RgbaImage::filled(8, 8, 255, 255, 255);
    const QualityMetrics m = score_quality(src, process(src, 1), QualityConfig{});

    REQUIRE(m.background_cleanness == Catch::Approx(1.0));
    REQUIRE(m.ridge_clarity == Catch::Approx(0.0));
    REQUIRE(m.contrast_ratio == Catch::Approx(0.0));
    REQUIRE(m.edge_preservation == Catch::Approx(1.0));
    REQUIRE(m.texture_uniformity == Catch::Approx(1.0));
    REQUIRE(m.overall_score == Catch::Approx(0.6));
}

TEST_CASE("quality_counts_dirty_valley_pixels") {
    const RgbaImage src = ridge_texture::testing::checkerboard(4, 4);
    RgbaImage processed = src;
    // Two of the eight valley pixels lose pure white.
    processed.pixel(1, 0)[1] = 250;
    processed.pixel(0, 1)[2] = 0;

    const QualityMetrics m = score_quality(src, processed, QualityConfig{});
    REQUIRE(m.background_cleanness == Catch::Approx(6.0 / 8.0));
}

TEST_CASE("quality_ridge_clarity_follows_variance_band") {
    // Constant ridges have zero variance: below the band.
    const RgbaImage src = ridge_texture::testing::stripes(16, 16, 2, 2, 40);
    QualityMetrics flat = score_quality(src, src, QualityConfig{});
    REQUIRE(flat.ridge_clarity == Catch::Approx(0.0));

    // Ridges alternating 0/100: variance 2500, the top of the band.
    RgbaImage varied = src;
    for (int y = 0; y < 16; ++y) {
        for (int x = 0; x < 16; ++x) {
            if (x % 4 < 2) {
                uint8_t *px = varied.pixel(x, y);
                px[0] = px[1] = px[2] = ((x + y) % 2 == 0) ? 0 : 100;
            }
        }
    }
    QualityMetrics in_band = score_quality(src, varied, QualityConfig{});
    REQUIRE(in_band.ridge_clarity == Catch::Approx(1.0));

    QualityConfig tight;
    tight.ridge_variance_band = {16.0f, 1250.0f};
    QualityMetrics above = score_quality(src, varied, tight);
    REQUIRE(above.ridge_clarity == Catch::Approx(0.5));
}

TEST_CASE("quality_edge_preservation_detects_flipped_boundary") {
    const RgbaImage src = ridge_texture::testing::checkerboard(2, 2);
    RgbaImage processed = src;
    uint8_t *px = processed.pixel(0, 0);
    px[0] = px[1] = px[2] = 255;

    const QualityMetrics m = score_quality(src, processed, QualityConfig{});
    REQUIRE(m.edge_preservation == Catch::Approx(0.75));
}

TEST_CASE("quality_is_pure_function_of_inputs") {
    const RgbaImage src = ridge_texture::testing::stripes(48, 40, 3, 5, 70);
    const RgbaImage out = process(src, 77);
    const QualityMetrics a = score_quality(src, out, QualityConfig{});
    const QualityMetrics b = score_quality(src, out, QualityConfig{});
    REQUIRE(a.overall_score == b.overall_score);
    REQUIRE(a.texture_uniformity == b.texture_uniformity);
}

TEST_CASE("quality_rejects_dimension_mismatch") {
    const RgbaImage a = RgbaImage::filled(4, 4, 0, 0, 0);
    const RgbaImage b = RgbaImage::filled(4, 5, 0, 0, 0);
    REQUIRE_THROWS_AS(score_quality(a, b, QualityConfig{}), ridge_texture::SynthesisError);
}

TEST_CASE("quality_rejects_unusable_config") {
    const RgbaImage img = ridge_texture::testing::checkerboard(8, 8);

    QualityConfig zero_block;
    zero_block.block_size = 0;
    REQUIRE_THROWS_AS(score_quality(img, img, zero_block), ridge_texture::ValidationError);

    QualityConfig negative_block;
    negative_block.block_size = -4;
    REQUIRE_THROWS_AS(score_quality(img, img, negative_block), ridge_texture::ValidationError);

    QualityConfig flat_band;
    flat_band.ridge_variance_band = {0.0f, 2500.0f};
    REQUIRE_THROWS_AS(score_quality(img, img, flat_band), ridge_texture::ValidationError);

    QualityConfig inverted_band;
    inverted_band.ridge_variance_band = {900.0f, 100.0f};
    REQUIRE_THROWS_AS(score_quality(img, img, inverted_band), ridge_texture::ValidationError);

    QualityConfig single_pixel_blocks;
    single_pixel_blocks.block_size = 1;
    REQUIRE_NOTHROW(score_quality(img, img, single_pixel_blocks));
}
