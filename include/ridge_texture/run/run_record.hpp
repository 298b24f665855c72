#pragma once

#include "ridge_texture/core/types.hpp"
#include "ridge_texture/storage/blob_store.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ridge_texture {

// Found by ADL from nlohmann::json, so they live beside the types.
void to_json(nlohmann::json& j, const QualityMetrics& m);
void from_json(const nlohmann::json& j, QualityMetrics& m);
void to_json(nlohmann::json& j, const OracleReport& r);
void from_json(const nlohmann::json& j, OracleReport& r);

} // namespace ridge_texture

namespace ridge_texture::run {

using json = nlohmann::json;

// One processing invocation. Written at creation and at most twice more
// (claim, terminal transition); never written after a terminal state.
struct ProcessingRun {
    std::string id;
    std::string source_ref;
    std::optional<std::string> case_id;
    std::optional<std::string> sample_id;
    std::string prompt_version;
    RunStatus status = RunStatus::Pending;

    std::optional<storage::BlobRef> processed_ref;
    std::optional<QualityMetrics> metrics;
    std::optional<OracleReport> oracle_report;
    std::optional<std::string> error_message;
    std::optional<std::string> error_kind;

    int64_t processing_time_ms = 0;
    std::string created_at;
    std::optional<std::string> completed_at;

    // Source metadata, when the caller knows it.
    std::optional<std::string> original_filename;
    std::optional<std::string> original_format;
    std::optional<int> original_width;
    std::optional<int> original_height;
    std::optional<int64_t> original_size_bytes;
    std::optional<std::string> original_sha256;
    std::optional<std::string> processed_sha256;

    uint64_t seed = 0;
};

bool transition_allowed(RunStatus from, RunStatus to);

// Moves `run` to `to`; throws StateError for any edge outside
// Pending -> Processing -> {Completed | Failed}.
void transition(ProcessingRun& run, RunStatus to);

void to_json(json& j, const ProcessingRun& run);
void from_json(const json& j, ProcessingRun& run);

} // namespace ridge_texture::run
