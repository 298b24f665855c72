#include "ridge_texture/image/sharpen.hpp"

#include <opencv2/opencv.hpp>
#include <vector>

namespace ridge_texture::image {

RgbaImage sharpen(const RgbaImage& img) {
    img.validate();

    // Read-only view over the input buffer; filter2D writes to new planes.
    cv::Mat src(img.height, img.width, CV_8UC4, const_cast<uint8_t*>(img.data.data()));

    std::vector<cv::Mat> channels;
    cv::split(src, channels);

    const cv::Mat kernel = (cv::Mat_<float>(3, 3) <<
         0.0f, -1.0f,  0.0f,
        -1.0f,  5.0f, -1.0f,
         0.0f, -1.0f,  0.0f);

    for (int c = 0; c < 3; ++c) {
        cv::Mat filtered;
        cv::filter2D(channels[c], filtered, CV_8U, kernel, cv::Point(-1, -1), 0.0,
                     cv::BORDER_REPLICATE);
        channels[c] = filtered;
    }

    RgbaImage out(img.width, img.height, std::vector<uint8_t>(img.expected_size()));
    cv::Mat dst(out.height, out.width, CV_8UC4, out.data.data());
    cv::merge(channels, dst);
    return out;
}

} // namespace ridge_texture::image
