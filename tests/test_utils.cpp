#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/parallel.hpp"
#include "ridge_texture/core/utils.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <vector>

namespace core = ridge_texture::core;

TEST_CASE("sha256_of_known_input") {
    const std::vector<uint8_t> abc = {'a', 'b', 'c'};
    REQUIRE(core::sha256_bytes(abc) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("run_id_and_timestamp_format") {
    const std::string id = core::get_run_id();
    REQUIRE(id.size() == 15 + 1 + 8);
    REQUIRE(id[8] == '_');
    REQUIRE(id[15] == '_');

    const std::string ts = core::get_iso_timestamp();
    REQUIRE(ts.size() == 24);
    REQUIRE(ts.back() == 'Z');
}

TEST_CASE("string_helpers") {
    REQUIRE(core::sanitize_filename("a b/c:d.png") == "a_b_c_d.png");
    REQUIRE(core::trim("  x y \n") == "x y");
    REQUIRE(core::split("a/b//c", '/') == std::vector<std::string>{"a", "b", "", "c"});
    REQUIRE(core::to_lower("PeNdInG") == "pending");
}

TEST_CASE("truncate_utf8_keeps_whole_code_points") {
    // "a" + e-acute (2 bytes) + euro sign (3 bytes)
    const std::string s = "a\xC3\xA9\xE2\x82\xAC";
    REQUIRE(core::truncate_utf8(s, 10) == s);
    REQUIRE(core::truncate_utf8(s, 6) == s);
    REQUIRE(core::truncate_utf8(s, 5) == "a\xC3\xA9");
    REQUIRE(core::truncate_utf8(s, 4) == "a\xC3\xA9");
    REQUIRE(core::truncate_utf8(s, 2) == "a");
    REQUIRE(core::truncate_utf8(s, 0).empty());
}

TEST_CASE("write_text_atomic_replaces_content") {
    ridge_texture::testing::TempDir dir;
    const auto p = dir.path() / "f.json";
    core::write_text_atomic(p, "one");
    core::write_text_atomic(p, "two");
    REQUIRE(core::read_text(p) == "two");
    REQUIRE_THROWS_AS(core::read_text(dir.path() / "none"), ridge_texture::IOError);
}

TEST_CASE("stddev_of_population") {
    REQUIRE(core::stddev_of({2.0f, 4.0f, 4.0f, 4.0f, 5.0f, 5.0f, 7.0f, 9.0f}) ==
            Catch::Approx(2.0f));
    REQUIRE(core::stddev_of({3.0f}) == 0.0f);
}

TEST_CASE("parallel_rows_visits_every_row_once") {
    std::vector<std::atomic<int>> hits(97);
    core::parallel_rows(97, 6, [&](int y) { hits[static_cast<size_t>(y)]++; });
    for (const auto &h : hits) REQUIRE(h.load() == 1);
    REQUIRE(core::compute_worker_count(8, 3) <= 3);
    REQUIRE(core::compute_worker_count(0, 10) >= 1);
}

TEST_CASE("parallel_rows_rethrows_worker_error") {
    auto fail_on_13 = [](int y) {
        if (y == 13) throw ridge_texture::SynthesisError("row 13");
    };
    REQUIRE_THROWS_AS(core::parallel_rows(20, 4, fail_on_13), ridge_texture::SynthesisError);
}

TEST_CASE("error_kind_taxonomy") {
    REQUIRE(ridge_texture::error_kind_of(ridge_texture::InvalidImage("x")) == "invalid_image");
    REQUIRE(ridge_texture::error_kind_of(ridge_texture::StorageError("x")) == "storage_error");
    REQUIRE(ridge_texture::error_kind_of(ridge_texture::StopRequested()) == "stop_requested");
    REQUIRE(ridge_texture::error_kind_of(std::runtime_error("x")) == "internal_error");
}
