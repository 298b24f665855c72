#include "ridge_texture/image/classifier.hpp"
#include "ridge_texture/core/parallel.hpp"

namespace ridge_texture::image {

ClassMap classify_pixels(const RgbaImage& img, int workers) {
    img.validate();

    ClassMap out;
    out.width = img.width;
    out.height = img.height;
    out.classes.assign(img.pixel_count(), PixelClass::Valley);

    core::parallel_rows(img.height, workers, [&](int y) {
        const size_t row_off = static_cast<size_t>(y) * static_cast<size_t>(img.width);
        for (int x = 0; x < img.width; ++x) {
            out.classes[row_off + static_cast<size_t>(x)] = classify_intensity(img.pixel(x, y)[0]);
        }
    });

    return out;
}

} // namespace ridge_texture::image
