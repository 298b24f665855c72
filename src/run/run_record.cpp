#include "ridge_texture/run/run_record.hpp"
#include "ridge_texture/core/errors.hpp"

namespace ridge_texture {

void to_json(nlohmann::json& j, const QualityMetrics& m) {
    j = nlohmann::json{
        {"textureUniformity", m.texture_uniformity},
        {"edgePreservation", m.edge_preservation},
        {"contrastRatio", m.contrast_ratio},
        {"ridgeClarity", m.ridge_clarity},
        {"backgroundCleanness", m.background_cleanness},
        {"overallScore", m.overall_score}
    };
}

void from_json(const nlohmann::json& j, QualityMetrics& m) {
    m.texture_uniformity = j.value("textureUniformity", 0.0);
    m.edge_preservation = j.value("edgePreservation", 0.0);
    m.contrast_ratio = j.value("contrastRatio", 0.0);
    m.ridge_clarity = j.value("ridgeClarity", 0.0);
    m.background_cleanness = j.value("backgroundCleanness", 0.0);
    m.overall_score = j.value("overallScore", 0.0);
}

void to_json(nlohmann::json& j, const OracleReport& r) {
    j = nlohmann::json{
        {"qualityAssessment", r.assessment},
        {"recommendations", r.recommendations},
        {"forensicNotes", r.notes},
        {"confidenceScore", r.confidence}
    };
}

void from_json(const nlohmann::json& j, OracleReport& r) {
    r.assessment = j.value("qualityAssessment", std::string());
    r.recommendations = j.value("recommendations", std::vector<std::string>());
    r.notes = j.value("forensicNotes", std::string());
    r.confidence = j.value("confidenceScore", 0.0);
}

} // namespace ridge_texture

namespace ridge_texture::run {

namespace {

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& v) {
    if (v) {
        j[key] = *v;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
void get_optional(const json& j, const char* key, std::optional<T>& v) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        v.reset();
    } else {
        v = it->get<T>();
    }
}

} // namespace

bool transition_allowed(RunStatus from, RunStatus to) {
    switch (from) {
        case RunStatus::Pending:
            return to == RunStatus::Processing;
        case RunStatus::Processing:
            return to == RunStatus::Completed || to == RunStatus::Failed;
        default:
            return false;
    }
}

void transition(ProcessingRun& run, RunStatus to) {
    if (!transition_allowed(run.status, to)) {
        throw StateError("run " + run.id + " cannot move from " +
                         run_status_to_string(run.status) + " to " +
                         run_status_to_string(to));
    }
    run.status = to;
}

void to_json(json& j, const ProcessingRun& run) {
    j = json::object();
    j["id"] = run.id;
    j["sourceRef"] = run.source_ref;
    put_optional(j, "caseId", run.case_id);
    put_optional(j, "sampleId", run.sample_id);
    j["promptVersion"] = run.prompt_version;
    j["status"] = run_status_to_string(run.status);
    if (run.processed_ref) {
        j["processedImage"] = {{"key", run.processed_ref->key}, {"url", run.processed_ref->url}};
    } else {
        j["processedImage"] = nullptr;
    }
    put_optional(j, "qualityMetrics", run.metrics);
    put_optional(j, "oracleReport", run.oracle_report);
    put_optional(j, "errorMessage", run.error_message);
    put_optional(j, "errorKind", run.error_kind);
    j["processingTimeMs"] = run.processing_time_ms;
    j["createdAt"] = run.created_at;
    put_optional(j, "completedAt", run.completed_at);
    put_optional(j, "originalFilename", run.original_filename);
    put_optional(j, "originalFormat", run.original_format);
    put_optional(j, "originalWidth", run.original_width);
    put_optional(j, "originalHeight", run.original_height);
    put_optional(j, "originalSizeBytes", run.original_size_bytes);
    put_optional(j, "originalSha256", run.original_sha256);
    put_optional(j, "processedSha256", run.processed_sha256);
    j["seed"] = run.seed;
}

void from_json(const json& j, ProcessingRun& run) {
    run.id = j.at("id").get<std::string>();
    run.source_ref = j.value("sourceRef", std::string());
    get_optional(j, "caseId", run.case_id);
    get_optional(j, "sampleId", run.sample_id);
    run.prompt_version = j.value("promptVersion", std::string());

    const std::string status = j.value("status", std::string("pending"));
    if (!string_to_run_status(status, run.status)) {
        throw ValidationError("unknown run status '" + status + "'");
    }

    auto it = j.find("processedImage");
    if (it != j.end() && it->is_object()) {
        run.processed_ref = storage::BlobRef{it->value("key", std::string()),
                                             it->value("url", std::string())};
    } else {
        run.processed_ref.reset();
    }
    get_optional(j, "qualityMetrics", run.metrics);
    get_optional(j, "oracleReport", run.oracle_report);
    get_optional(j, "errorMessage", run.error_message);
    get_optional(j, "errorKind", run.error_kind);
    run.processing_time_ms = j.value("processingTimeMs", int64_t{0});
    run.created_at = j.value("createdAt", std::string());
    get_optional(j, "completedAt", run.completed_at);
    get_optional(j, "originalFilename", run.original_filename);
    get_optional(j, "originalFormat", run.original_format);
    get_optional(j, "originalWidth", run.original_width);
    get_optional(j, "originalHeight", run.original_height);
    get_optional(j, "originalSizeBytes", run.original_size_bytes);
    get_optional(j, "originalSha256", run.original_sha256);
    get_optional(j, "processedSha256", run.processed_sha256);
    run.seed = j.value("seed", uint64_t{0});
}

} // namespace ridge_texture::run
