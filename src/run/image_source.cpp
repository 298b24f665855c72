#include "ridge_texture/run/image_source.hpp"
#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/utils.hpp"
#include "ridge_texture/io/image_codec.hpp"

#include <utility>

namespace ridge_texture::run {

FileImageSource::FileImageSource(fs::path blob_root) : blob_root_(std::move(blob_root)) {}

fs::path FileImageSource::resolve(const std::string& ref) const {
    if (ref.empty()) {
        throw InvalidImage("empty source reference");
    }
    const std::string path = core::starts_with(ref, "file://") ? ref.substr(7) : ref;
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        return fs::path(path);
    }
    const fs::path in_store = blob_root_ / path;
    if (fs::is_regular_file(in_store, ec)) {
        return in_store;
    }
    throw InvalidImage("source not found: " + ref);
}

LoadedImage FileImageSource::load(const std::string& ref) const {
    const fs::path p = resolve(ref);
    LoadedImage out;
    try {
        out.bytes = core::read_bytes(p);
    } catch (const IOError& e) {
        throw InvalidImage(e.what());
    }
    out.image = io::decode_image(out.bytes);
    out.filename = p.filename().string();
    std::string ext = core::to_lower(p.extension().string());
    out.format = ext.empty() ? std::string() : ext.substr(1);
    return out;
}

std::string FileImageSource::locate(const std::string& ref) const {
    return fs::absolute(resolve(ref)).string();
}

} // namespace ridge_texture::run
