#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/utils.hpp"
#include "ridge_texture/storage/blob_store.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using ridge_texture::StorageError;
using ridge_texture::storage::BlobRef;
using ridge_texture::storage::LocalBlobStore;
using ridge_texture::storage::make_forensic_key;
using ridge_texture::storage::normalize_key;
namespace core = ridge_texture::core;

TEST_CASE("blob_key_normalisation") {
    REQUIRE(normalize_key("/a/b.png") == "a/b.png");
    REQUIRE(normalize_key("///a") == "a");
    REQUIRE_THROWS_AS(normalize_key(""), StorageError);
    REQUIRE_THROWS_AS(normalize_key("///"), StorageError);
    REQUIRE_THROWS_AS(normalize_key("a/../../etc/passwd"), StorageError);
}

TEST_CASE("blob_put_writes_file_and_returns_public_url") {
    ridge_texture::testing::TempDir dir;
    LocalBlobStore store(dir.path(), "https://cdn.example.org/prints/");
    const std::vector<uint8_t> bytes = {1, 2, 3, 4};

    const BlobRef ref = store.put("/forensic/x.png", bytes, "image/png");
    REQUIRE(ref.key == "forensic/x.png");
    REQUIRE(ref.url == "https://cdn.example.org/prints/forensic/x.png");
    REQUIRE(core::read_bytes(dir.path() / "forensic" / "x.png") == bytes);

    const BlobRef again = store.get("forensic/x.png");
    REQUIRE(again.url == ref.url);
}

TEST_CASE("blob_store_without_base_url_uses_file_urls") {
    ridge_texture::testing::TempDir dir;
    LocalBlobStore store(dir.path());
    const BlobRef ref = store.put("k/v.bin", {9}, "application/octet-stream");
    REQUIRE(core::starts_with(ref.url, "file://"));
    REQUIRE_THAT(ref.url, Catch::Matchers::EndsWith("k/v.bin"));
}

TEST_CASE("blob_get_of_missing_key_fails") {
    ridge_texture::testing::TempDir dir;
    LocalBlobStore store(dir.path());
    REQUIRE_THROWS_AS(store.get("nope.png"), StorageError);
}

TEST_CASE("forensic_key_layout") {
    const std::string full = make_forensic_key("processed", "print 1.png", "C-7", "S:2");
    REQUIRE(core::starts_with(full, "forensic/case-C-7/sample-S_2/processed/"));
    REQUIRE_THAT(full, Catch::Matchers::EndsWith("-print_1.png"));
    REQUIRE(full.find(':') == std::string::npos);

    const std::string bare = make_forensic_key("original", "a.png", "", "");
    REQUIRE(core::starts_with(bare, "forensic/original/"));

    REQUIRE(make_forensic_key("original", "a.png", "", "") != bare);
}
