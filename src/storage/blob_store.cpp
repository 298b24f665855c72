#include "ridge_texture/storage/blob_store.hpp"
#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/utils.hpp"

#include <algorithm>
#include <utility>

namespace ridge_texture::storage {

std::string normalize_key(const std::string& key) {
    std::string k = key;
    const size_t first = k.find_first_not_of('/');
    k = (first == std::string::npos) ? std::string() : k.substr(first);
    if (k.empty()) {
        throw StorageError("blob key must not be empty");
    }
    for (const auto& part : core::split(k, '/')) {
        if (part == "..") {
            throw StorageError("blob key must not contain '..': " + key);
        }
    }
    return k;
}

std::string make_forensic_key(const std::string& type, const std::string& filename,
                              const std::string& case_id, const std::string& sample_id) {
    std::string ts = core::get_iso_timestamp();
    std::replace(ts.begin(), ts.end(), ':', '-');
    std::replace(ts.begin(), ts.end(), '.', '-');

    std::string key = "forensic/";
    if (!case_id.empty()) key += "case-" + core::sanitize_filename(case_id) + "/";
    if (!sample_id.empty()) key += "sample-" + core::sanitize_filename(sample_id) + "/";
    key += core::sanitize_filename(type) + "/" + ts + "-" + core::random_token(8) + "-" +
           core::sanitize_filename(filename.empty() ? std::string("image.png") : filename);
    return key;
}

LocalBlobStore::LocalBlobStore(fs::path root, std::string public_base_url)
    : root_(std::move(root)), public_base_url_(std::move(public_base_url)) {
    while (!public_base_url_.empty() && public_base_url_.back() == '/') {
        public_base_url_.pop_back();
    }
}

fs::path LocalBlobStore::path_for(const std::string& key) const {
    return root_ / normalize_key(key);
}

std::string LocalBlobStore::url_for(const std::string& key) const {
    if (!public_base_url_.empty()) {
        return public_base_url_ + "/" + key;
    }
    return "file://" + fs::absolute(root_ / key).string();
}

BlobRef LocalBlobStore::put(const std::string& key, const std::vector<uint8_t>& bytes,
                            const std::string& content_type) {
    const std::string k = normalize_key(key);
    const fs::path p = root_ / k;
    try {
        fs::create_directories(p.parent_path());
        core::write_bytes(p, bytes);
    } catch (const fs::filesystem_error& e) {
        throw StorageError("upload of " + k + " (" + content_type + ") failed: " + e.what());
    } catch (const IOError& e) {
        throw StorageError("upload of " + k + " (" + content_type + ") failed: " + e.what());
    }
    return {k, url_for(k)};
}

BlobRef LocalBlobStore::get(const std::string& key) const {
    const std::string k = normalize_key(key);
    if (!fs::exists(root_ / k)) {
        throw StorageError("no blob stored under " + k);
    }
    return {k, url_for(k)};
}

} // namespace ridge_texture::storage
