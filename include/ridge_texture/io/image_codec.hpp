#pragma once

#include "ridge_texture/image/rgba_image.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ridge_texture::io {

namespace fs = std::filesystem;

// Decodes PNG/JPEG/BMP/... bytes into RGBA8. Grey, BGR and BGRA inputs are
// converted; 16-bit inputs are scaled down to 8 bits.
// Throws InvalidImage if the bytes cannot be decoded.
image::RgbaImage decode_image(const std::vector<uint8_t>& bytes);

image::RgbaImage read_image_file(const fs::path& path);

std::vector<uint8_t> encode_png(const image::RgbaImage& img);

// Best-effort MIME type from the file extension ("image/png" by default).
std::string content_type_for(const fs::path& path);

} // namespace ridge_texture::io
