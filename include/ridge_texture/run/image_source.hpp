#pragma once

#include "ridge_texture/image/rgba_image.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ridge_texture::run {

namespace fs = std::filesystem;

struct LoadedImage {
    image::RgbaImage image;
    std::vector<uint8_t> bytes; // encoded source, for hashing
    std::string filename;
    std::string format;         // lower-case extension without the dot
};

// Resolves a run's source reference into pixels.
class ImageSource {
public:
    virtual ~ImageSource() = default;

    // Throws InvalidImage when the reference cannot be read or decoded.
    virtual LoadedImage load(const std::string& ref) const = 0;
    // A path or URL an external reviewer can fetch for `ref`.
    virtual std::string locate(const std::string& ref) const = 0;
};

// Local paths first, then keys under the blob root.
class FileImageSource : public ImageSource {
public:
    explicit FileImageSource(fs::path blob_root);

    LoadedImage load(const std::string& ref) const override;
    std::string locate(const std::string& ref) const override;

private:
    fs::path resolve(const std::string& ref) const;

    fs::path blob_root_;
};

} // namespace ridge_texture::run
