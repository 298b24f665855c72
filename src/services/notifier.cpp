#include "ridge_texture/services/notifier.hpp"
#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/utils.hpp"
#include "ridge_texture/services/http_client.hpp"

#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

namespace ridge_texture::services {

namespace {

std::string percent(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v * 100.0 << "%";
    return oss.str();
}

} // namespace

void validate_notification(const std::string& title, const std::string& content) {
    if (core::trim(title).empty()) {
        throw ValidationError("notification title is required");
    }
    if (core::trim(content).empty()) {
        throw ValidationError("notification content is required");
    }
    if (title.size() > kMaxNotificationTitle) {
        throw ValidationError("notification title must be at most " +
                              std::to_string(kMaxNotificationTitle) + " characters");
    }
    if (content.size() > kMaxNotificationContent) {
        throw ValidationError("notification content must be at most " +
                              std::to_string(kMaxNotificationContent) + " characters");
    }
}

HttpNotifier::HttpNotifier(config::NotifierConfig cfg) : cfg_(std::move(cfg)) {}

bool HttpNotifier::notify(const std::string& title, const std::string& content,
                          const core::CancelToken& stop) {
    validate_notification(title, content);
    const nlohmann::json payload{{"title", title}, {"content", content}};
    HttpResponse resp;
    try {
        const std::string body =
            payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        resp = post_json(cfg_.endpoint, body, env_or_empty(cfg_.api_key_env),
                         cfg_.timeout_ms, &stop);
    } catch (const IOError& e) {
        throw NotificationFailed(e.what());
    }
    return resp.ok();
}

Notification build_notification(const run::ProcessingRun& run, double perfect_threshold) {
    Notification n;
    std::ostringstream body;
    body << "Run: " << run.id << "\n";
    body << "Case: " << run.case_id.value_or("N/A") << "\n";
    body << "Sample: " << run.sample_id.value_or("N/A") << "\n";
    body << "Processing time: " << run.processing_time_ms << "ms\n";
    body << "Version: " << run.prompt_version << "\n";

    if (run.status == RunStatus::Failed) {
        n.title = "PROCESSING FAILED";
        body << "Error: " << run.error_message.value_or("unknown error");
        if (run.error_kind) body << " (" << *run.error_kind << ")";
        body << "\n";
        n.content = core::truncate_utf8(body.str(), kMaxNotificationContent);
        return n;
    }

    double score = run.metrics ? run.metrics->overall_score : 0.0;
    if (run.oracle_report) score = run.oracle_report->confidence;
    n.title = score >= perfect_threshold ? "PROCESSING PERFECT" : "PROCESSING COMPLETED";

    body << "Score: " << percent(score) << "\n";
    if (run.metrics) {
        const auto& m = *run.metrics;
        body << "\nQuality metrics:\n";
        body << "  texture uniformity: " << percent(m.texture_uniformity) << "\n";
        body << "  edge preservation: " << percent(m.edge_preservation) << "\n";
        body << "  contrast ratio: " << percent(m.contrast_ratio) << "\n";
        body << "  ridge clarity: " << percent(m.ridge_clarity) << "\n";
        body << "  background cleanness: " << percent(m.background_cleanness) << "\n";
        body << "  overall: " << percent(m.overall_score) << "\n";
    }
    if (run.oracle_report) {
        const auto& r = *run.oracle_report;
        body << "\nAssessment: " << r.assessment << "\n";
        if (!r.recommendations.empty()) {
            body << "Recommendations:\n";
            for (const auto& rec : r.recommendations) body << "  - " << rec << "\n";
        }
        if (!r.notes.empty()) body << "Notes: " << r.notes << "\n";
    }
    if (run.processed_ref) {
        body << "\nProcessed image: " << run.processed_ref->url << "\n";
    }

    n.content = core::truncate_utf8(body.str(), kMaxNotificationContent);
    return n;
}

} // namespace ridge_texture::services
