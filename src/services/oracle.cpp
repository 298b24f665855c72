#include "ridge_texture/services/oracle.hpp"
#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/utils.hpp"
#include "ridge_texture/io/image_codec.hpp"
#include "ridge_texture/run/run_record.hpp"
#include "ridge_texture/services/http_client.hpp"

#include <QByteArray>

#include <algorithm>
#include <utility>

namespace ridge_texture::services {

using json = nlohmann::json;

namespace {

const char* kSystemPrompt =
    "You are an expert forensic fingerprint analysis specialist. Compare the "
    "original fingerprint with the processed one. Ridges should carry a fine "
    "achromatic granular texture, valleys must be pure white, and ridge "
    "geometry must be unchanged. Report problems precisely.";

json response_schema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"qualityAssessment", {{"type", "string"}}},
          {"recommendations", {{"type", "array"}, {"items", {{"type", "string"}}}}},
          {"forensicNotes", {{"type", "string"}}},
          {"confidenceScore", {{"type", "number"}}}}},
        {"required", {"qualityAssessment", "recommendations", "forensicNotes", "confidenceScore"}},
        {"additionalProperties", false}
    };
}

} // namespace

std::string to_image_url(const std::string& ref) {
    if (core::starts_with(ref, "http://") || core::starts_with(ref, "https://") ||
        core::starts_with(ref, "data:")) {
        return ref;
    }
    const std::string path = core::starts_with(ref, "file://") ? ref.substr(7) : ref;
    std::vector<uint8_t> bytes;
    try {
        bytes = core::read_bytes(path);
    } catch (const IOError& e) {
        throw OracleUnavailable(std::string("cannot inline image: ") + e.what());
    }
    const QByteArray raw(reinterpret_cast<const char*>(bytes.data()),
                         static_cast<int>(bytes.size()));
    return "data:" + io::content_type_for(path) + ";base64," + raw.toBase64().toStdString();
}

HttpQualityOracle::HttpQualityOracle(config::OracleConfig cfg) : cfg_(std::move(cfg)) {}

json HttpQualityOracle::build_request(const std::string& original_ref,
                                      const std::string& processed_ref,
                                      int64_t elapsed_ms) const {
    json user_content = json::array();
    user_content.push_back({{"type", "text"},
                            {"text", "Analyze the texture application. The first image is the "
                                     "original, the second the processed result. Processing time: " +
                                         std::to_string(elapsed_ms) + "ms."}});
    user_content.push_back(
        {{"type", "image_url"}, {"image_url", {{"url", to_image_url(original_ref)}, {"detail", "high"}}}});
    user_content.push_back(
        {{"type", "image_url"}, {"image_url", {{"url", to_image_url(processed_ref)}, {"detail", "high"}}}});

    return json{
        {"model", cfg_.model},
        {"messages",
         json::array({{{"role", "system"}, {"content", kSystemPrompt}},
                      {{"role", "user"}, {"content", user_content}}})},
        {"response_format",
         {{"type", "json_schema"},
          {"json_schema",
           {{"name", "forensic_quality_assessment"}, {"strict", true}, {"schema", response_schema()}}}}}
    };
}

OracleReport parse_oracle_response(const std::string& body) {
    try {
        const json resp = json::parse(body);
        const auto& choices = resp.at("choices");
        if (!choices.is_array() || choices.empty()) {
            throw OracleUnavailable("response has no choices");
        }
        const auto& content = choices.at(0).at("message").at("content");
        if (!content.is_string()) {
            throw OracleUnavailable("assistant message is not text");
        }
        OracleReport report = json::parse(content.get<std::string>()).get<OracleReport>();
        report.confidence = std::clamp(report.confidence, 0.0, 1.0);
        return report;
    } catch (const json::exception& e) {
        throw OracleUnavailable(std::string("malformed response: ") + e.what());
    }
}

OracleReport HttpQualityOracle::assess(const std::string& original_ref,
                                       const std::string& processed_ref,
                                       int64_t elapsed_ms,
                                       const core::CancelToken& stop) {
    const std::string body = build_request(original_ref, processed_ref, elapsed_ms).dump();
    HttpResponse resp;
    try {
        resp = post_json(cfg_.endpoint, body, env_or_empty(cfg_.api_key_env), cfg_.timeout_ms,
                         &stop);
    } catch (const IOError& e) {
        throw OracleUnavailable(e.what());
    }
    if (!resp.ok()) {
        throw OracleUnavailable("HTTP " + std::to_string(resp.status) + ": " +
                                resp.body.substr(0, 200));
    }
    return parse_oracle_response(resp.body);
}

} // namespace ridge_texture::services
