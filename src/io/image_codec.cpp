#include "ridge_texture/io/image_codec.hpp"
#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/utils.hpp"

#include <opencv2/opencv.hpp>

namespace ridge_texture::io {

image::RgbaImage decode_image(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw InvalidImage("empty input buffer");
    }

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(cv::Mat(1, static_cast<int>(bytes.size()), CV_8UC1,
                                       const_cast<uint8_t*>(bytes.data())),
                               cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw InvalidImage(std::string("decoder failed: ") + e.what());
    }
    if (decoded.empty()) {
        throw InvalidImage("unsupported or corrupt image data");
    }

    if (decoded.depth() == CV_16U) {
        decoded.convertTo(decoded, CV_8U, 1.0 / 257.0);
    } else if (decoded.depth() != CV_8U) {
        throw InvalidImage("unsupported sample depth");
    }

    cv::Mat rgba;
    switch (decoded.channels()) {
        case 1: cv::cvtColor(decoded, rgba, cv::COLOR_GRAY2RGBA); break;
        case 3: cv::cvtColor(decoded, rgba, cv::COLOR_BGR2RGBA); break;
        case 4: cv::cvtColor(decoded, rgba, cv::COLOR_BGRA2RGBA); break;
        default:
            throw InvalidImage("unsupported channel count " + std::to_string(decoded.channels()));
    }

    image::RgbaImage out;
    out.width = rgba.cols;
    out.height = rgba.rows;
    out.data.resize(out.expected_size());
    cv::Mat dst(out.height, out.width, CV_8UC4, out.data.data());
    rgba.copyTo(dst);
    return out;
}

image::RgbaImage read_image_file(const fs::path& path) {
    if (!fs::exists(path)) {
        throw InvalidImage("source image not found: " + path.string());
    }
    return decode_image(core::read_bytes(path));
}

std::vector<uint8_t> encode_png(const image::RgbaImage& img) {
    img.validate();

    cv::Mat rgba(img.height, img.width, CV_8UC4, const_cast<uint8_t*>(img.data.data()));
    cv::Mat bgra;
    cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);

    std::vector<uint8_t> out;
    if (!cv::imencode(".png", bgra, out)) {
        throw IOError("PNG encoding failed");
    }
    return out;
}

std::string content_type_for(const fs::path& path) {
    const std::string ext = core::to_lower(path.extension().string());
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".bmp") return "image/bmp";
    if (ext == ".tif" || ext == ".tiff") return "image/tiff";
    if (ext == ".webp") return "image/webp";
    return "image/png";
}

} // namespace ridge_texture::io
