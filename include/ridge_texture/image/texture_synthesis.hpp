#pragma once

#include "ridge_texture/core/types.hpp"
#include "ridge_texture/image/rgba_image.hpp"

#include <cstdint>

namespace ridge_texture::image {

// Applies granular achromatic noise to ridge pixels and forces valley
// pixels to pure white. Alpha is copied unchanged.
//
// Ridge:  R = G = B = clamp(red + n, 0, 255), n uniform in
//         [-kNoiseHalfWidth, +kNoiseHalfWidth].
// Valley: R = G = B = 255.
//
// Each row draws from its own generator seeded with (seed, row), so the
// output depends only on the inputs and `seed`, not on `workers`.
// Throws SynthesisError if `classes` does not match the image dimensions.
RgbaImage synthesize_texture(const RgbaImage& source, const ClassMap& classes,
                             uint64_t seed, int workers = 1);

// Throws SynthesisError if any valley pixel has a colour channel below 255.
void verify_valley_invariant(const RgbaImage& img, const ClassMap& classes);

} // namespace ridge_texture::image
