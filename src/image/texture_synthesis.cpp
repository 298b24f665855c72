#include "ridge_texture/image/texture_synthesis.hpp"
#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/parallel.hpp"

#include <algorithm>
#include <random>
#include <string>

namespace ridge_texture::image {

namespace {

void require_matching_classes(const RgbaImage& img, const ClassMap& classes) {
    if (classes.width != img.width || classes.height != img.height ||
        classes.classes.size() != img.pixel_count()) {
        throw SynthesisError("class map " + std::to_string(classes.width) + "x" +
                             std::to_string(classes.height) +
                             " was not produced from image " +
                             std::to_string(img.width) + "x" + std::to_string(img.height));
    }
}

std::mt19937_64 row_generator(uint64_t seed, int row) {
    std::seed_seq seq{static_cast<uint32_t>(seed & 0xffffffffu),
                      static_cast<uint32_t>(seed >> 32),
                      static_cast<uint32_t>(row)};
    return std::mt19937_64(seq);
}

} // namespace

RgbaImage synthesize_texture(const RgbaImage& source, const ClassMap& classes,
                             uint64_t seed, int workers) {
    source.validate();
    require_matching_classes(source, classes);

    RgbaImage out = source;

    core::parallel_rows(source.height, workers, [&](int y) {
        std::mt19937_64 gen = row_generator(seed, y);
        std::uniform_int_distribution<int> noise(-kNoiseHalfWidth, kNoiseHalfWidth);
        for (int x = 0; x < source.width; ++x) {
            uint8_t* px = out.pixel(x, y);
            if (classes.at(x, y) == PixelClass::Ridge) {
                const int v = std::clamp(static_cast<int>(source.pixel(x, y)[0]) + noise(gen), 0, 255);
                px[0] = px[1] = px[2] = static_cast<uint8_t>(v);
            } else {
                px[0] = px[1] = px[2] = 255;
            }
        }
    });

    return out;
}

void verify_valley_invariant(const RgbaImage& img, const ClassMap& classes) {
    require_matching_classes(img, classes);

    size_t contaminated = 0;
    for (int y = 0; y < img.height; ++y) {
        for (int x = 0; x < img.width; ++x) {
            if (classes.at(x, y) != PixelClass::Valley) continue;
            const uint8_t* px = img.pixel(x, y);
            if (px[0] != 255 || px[1] != 255 || px[2] != 255) {
                ++contaminated;
            }
        }
    }
    if (contaminated > 0) {
        throw SynthesisError(std::to_string(contaminated) +
                             " valley pixel(s) are not pure white");
    }
}

} // namespace ridge_texture::image
