#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ridge_texture::storage {

namespace fs = std::filesystem;

struct BlobRef {
    std::string key;
    std::string url;
};

class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual BlobRef put(const std::string& key, const std::vector<uint8_t>& bytes,
                        const std::string& content_type) = 0;
    virtual BlobRef get(const std::string& key) const = 0;
};

// Stores blobs as files below `root`. URLs are `public_base_url/key` when a
// base URL is configured, otherwise file:// URLs of the stored files.
class LocalBlobStore : public BlobStore {
public:
    LocalBlobStore(fs::path root, std::string public_base_url = std::string());

    BlobRef put(const std::string& key, const std::vector<uint8_t>& bytes,
                const std::string& content_type) override;
    BlobRef get(const std::string& key) const override;

    // Filesystem location of a stored key.
    fs::path path_for(const std::string& key) const;
    const fs::path& root() const { return root_; }

private:
    std::string url_for(const std::string& key) const;

    fs::path root_;
    std::string public_base_url_;
};

// Strips leading '/' and rejects empty keys or '..' segments
// (StorageError).
std::string normalize_key(const std::string& key);

// forensic/[case-<case_id>/][sample-<sample_id>/]<type>/<timestamp>-<id8>-<name>
std::string make_forensic_key(const std::string& type, const std::string& filename,
                              const std::string& case_id, const std::string& sample_id);

} // namespace ridge_texture::storage
