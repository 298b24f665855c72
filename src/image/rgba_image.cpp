#include "ridge_texture/image/rgba_image.hpp"
#include "ridge_texture/core/errors.hpp"

#include <string>
#include <utility>

namespace ridge_texture::image {

RgbaImage::RgbaImage(int w, int h, std::vector<uint8_t> rgba)
    : width(w), height(h), data(std::move(rgba)) {}

RgbaImage RgbaImage::filled(int w, int h, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    RgbaImage img;
    img.width = w;
    img.height = h;
    img.data.resize(img.expected_size());
    for (size_t i = 0; i + 3 < img.data.size(); i += 4) {
        img.data[i] = r;
        img.data[i + 1] = g;
        img.data[i + 2] = b;
        img.data[i + 3] = a;
    }
    return img;
}

size_t RgbaImage::pixel_count() const {
    if (width <= 0 || height <= 0) return 0;
    return static_cast<size_t>(width) * static_cast<size_t>(height);
}

size_t RgbaImage::expected_size() const {
    return pixel_count() * 4;
}

void RgbaImage::validate() const {
    if (width < 1 || height < 1) {
        throw InvalidImage("dimensions must be at least 1x1, got " +
                           std::to_string(width) + "x" + std::to_string(height));
    }
    if (data.size() != expected_size()) {
        throw InvalidImage("buffer length " + std::to_string(data.size()) +
                           " does not match " + std::to_string(width) + "x" +
                           std::to_string(height) + "x4");
    }
}

const uint8_t* RgbaImage::pixel(int x, int y) const {
    return data.data() + (static_cast<size_t>(y) * static_cast<size_t>(width) +
                          static_cast<size_t>(x)) * 4;
}

uint8_t* RgbaImage::pixel(int x, int y) {
    return data.data() + (static_cast<size_t>(y) * static_cast<size_t>(width) +
                          static_cast<size_t>(x)) * 4;
}

bool RgbaImage::operator==(const RgbaImage& o) const {
    return width == o.width && height == o.height && data == o.data;
}

} // namespace ridge_texture::image
