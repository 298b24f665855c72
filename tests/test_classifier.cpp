#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/image/classifier.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

using ridge_texture::ClassMap;
using ridge_texture::PixelClass;
using ridge_texture::image::RgbaImage;
using ridge_texture::image::classify_pixels;

TEST_CASE("classifier_uses_red_channel_threshold_128") {
    RgbaImage img = RgbaImage::filled(4, 1, 0, 0, 0);
    img.pixel(0, 0)[0] = 0;
    img.pixel(1, 0)[0] = 127;
    img.pixel(2, 0)[0] = 128;
    img.pixel(3, 0)[0] = 255;

    const ClassMap m = classify_pixels(img);
    REQUIRE(m.at(0, 0) == PixelClass::Ridge);
    REQUIRE(m.at(1, 0) == PixelClass::Ridge);
    REQUIRE(m.at(2, 0) == PixelClass::Valley);
    REQUIRE(m.at(3, 0) == PixelClass::Valley);
}

TEST_CASE("classifier_ignores_green_blue_and_alpha") {
    RgbaImage img = RgbaImage::filled(2, 1, 200, 0, 0, 0);
    img.pixel(1, 0)[0] = 10;
    img.pixel(1, 0)[1] = 255;
    img.pixel(1, 0)[2] = 255;

    const ClassMap m = classify_pixels(img);
    REQUIRE(m.at(0, 0) == PixelClass::Valley);
    REQUIRE(m.at(1, 0) == PixelClass::Ridge);
}

TEST_CASE("classifier_result_is_independent_of_worker_count") {
    const RgbaImage img = ridge_texture::testing::checkerboard(37, 23, 3);
    const ClassMap one = classify_pixels(img, 1);
    const ClassMap many = classify_pixels(img, 8);
    REQUIRE(one.classes == many.classes);
    REQUIRE(one.count(PixelClass::Ridge) + one.count(PixelClass::Valley) == img.pixel_count());
}

TEST_CASE("classifier_rejects_inconsistent_buffer") {
    RgbaImage img(3, 3, std::vector<uint8_t>(3 * 3 * 4 - 1, 0));
    REQUIRE_THROWS_AS(classify_pixels(img), ridge_texture::InvalidImage);

    RgbaImage empty;
    REQUIRE_THROWS_AS(classify_pixels(empty), ridge_texture::InvalidImage);
}
