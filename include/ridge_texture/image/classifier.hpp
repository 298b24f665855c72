#pragma once

#include "ridge_texture/core/types.hpp"
#include "ridge_texture/image/rgba_image.hpp"

namespace ridge_texture::image {

// Classifies every pixel from its red channel against kRidgeThreshold.
// Throws InvalidImage if the image layout is inconsistent.
ClassMap classify_pixels(const RgbaImage& img, int workers = 1);

} // namespace ridge_texture::image
