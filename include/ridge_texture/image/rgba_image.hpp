#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ridge_texture::image {

// Decoded image with an interleaved RGBA8 buffer, row-major.
struct RgbaImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> data;

    RgbaImage() = default;
    RgbaImage(int w, int h, std::vector<uint8_t> rgba);

    static RgbaImage filled(int w, int h, uint8_t r, uint8_t g, uint8_t b,
                            uint8_t a = 255);

    size_t pixel_count() const;
    size_t expected_size() const;

    // Throws InvalidImage when dimensions are < 1 or the buffer length is
    // not width*height*4.
    void validate() const;

    const uint8_t* pixel(int x, int y) const;
    uint8_t* pixel(int x, int y);

    bool operator==(const RgbaImage& o) const;
    bool operator!=(const RgbaImage& o) const { return !(*this == o); }
};

} // namespace ridge_texture::image
