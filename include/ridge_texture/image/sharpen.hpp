#pragma once

#include "ridge_texture/image/rgba_image.hpp"

namespace ridge_texture::image {

// Convolves R, G and B independently with
//    0 -1  0
//   -1  5 -1
//    0 -1  0
// replicating edge pixels at the border and saturating to [0,255].
// Alpha is copied unchanged.
RgbaImage sharpen(const RgbaImage& img);

} // namespace ridge_texture::image
