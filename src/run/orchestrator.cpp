#include "ridge_texture/run/orchestrator.hpp"
#include "ridge_texture/core/bounded_task.hpp"
#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/utils.hpp"
#include "ridge_texture/image/classifier.hpp"
#include "ridge_texture/image/sharpen.hpp"
#include "ridge_texture/image/texture_synthesis.hpp"
#include "ridge_texture/io/image_codec.hpp"
#include "ridge_texture/metrics/quality.hpp"

#include <random>
#include <utility>

namespace ridge_texture::run {

using json = nlohmann::json;

namespace {

void check_stop(const core::CancelToken* cancel) {
    if (core::stop_requested(cancel)) {
        throw StopRequested();
    }
}

} // namespace

RunOrchestrator::RunOrchestrator(const config::Config& cfg, storage::RunStore& store,
                                 storage::BlobStore& blobs, const ImageSource& source,
                                 std::shared_ptr<services::QualityOracle> oracle,
                                 std::shared_ptr<services::Notifier> notifier,
                                 core::EventEmitter& events, std::ostream& events_out,
                                 std::ostream& log)
    : cfg_(cfg), store_(store), blobs_(blobs), source_(source), oracle_(std::move(oracle)),
      notifier_(std::move(notifier)), events_(events), events_out_(events_out), log_(log) {
    cfg_.validate();
}

uint64_t RunOrchestrator::pick_seed(const RunRequest& request) const {
    if (request.seed) return *request.seed;
    if (cfg_.synthesis.seed != 0) return cfg_.synthesis.seed;
    std::random_device rd;
    const uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ rd();
    return seed == 0 ? 1 : seed;
}

ProcessingRun RunOrchestrator::new_record(const RunRequest& request, RunStatus status) const {
    ProcessingRun r;
    r.id = core::get_run_id();
    r.source_ref = request.source_ref;
    r.case_id = request.case_id;
    r.sample_id = request.sample_id;
    r.prompt_version = cfg_.pipeline.prompt_version;
    r.status = status;
    r.created_at = core::get_iso_timestamp();
    r.original_filename = request.original_filename;
    r.original_format = request.original_format;
    r.original_width = request.original_width;
    r.original_height = request.original_height;
    r.original_size_bytes = request.original_size_bytes;
    r.seed = pick_seed(request);
    return r;
}

bool RunOrchestrator::persist(const ProcessingRun& record, bool created) {
    try {
        if (created) {
            store_.update(record);
        } else {
            store_.create(record);
        }
        return true;
    } catch (const StoreUnavailable& e) {
        events_.warning(record.id, e.what(), events_out_);
        log_ << "[run " << record.id << "] Warning: " << e.what() << std::endl;
        return false;
    } catch (const StateError& e) {
        // e.g. the record was deleted while the run was in flight
        events_.warning(record.id, e.what(), events_out_);
        log_ << "[run " << record.id << "] Warning: " << e.what() << std::endl;
        return false;
    }
}

ProcessingRun RunOrchestrator::enqueue(const RunRequest& request) {
    if (request.source_ref.empty()) {
        throw ValidationError("a pending run needs a source reference");
    }
    ProcessingRun record = new_record(request, RunStatus::Pending);
    store_.create(record);
    log_ << "[run " << record.id << "] Queued " << record.source_ref << std::endl;
    return record;
}

RunOutcome RunOrchestrator::submit(const RunRequest& request, const core::CancelToken* cancel) {
    ProcessingRun record = new_record(request, RunStatus::Processing);
    const bool created = persist(record, false);
    RunOutcome outcome = execute(std::move(record), request, cancel, created);
    outcome.persisted = outcome.persisted && created;
    return outcome;
}

RunOutcome RunOrchestrator::claim(const std::string& run_id, const core::CancelToken* cancel) {
    std::optional<ProcessingRun> found = store_.get(run_id);
    if (!found) {
        throw StateError("unknown run " + run_id);
    }
    ProcessingRun record = std::move(*found);
    transition(record, RunStatus::Processing);
    store_.update(record);

    RunRequest request;
    request.source_ref = record.source_ref;
    request.case_id = record.case_id;
    request.sample_id = record.sample_id;
    request.original_filename = record.original_filename;
    request.original_format = record.original_format;
    request.original_width = record.original_width;
    request.original_height = record.original_height;
    request.original_size_bytes = record.original_size_bytes;
    request.seed = record.seed;
    return execute(std::move(record), request, cancel, true);
}

RunOutcome RunOrchestrator::execute(ProcessingRun record, const RunRequest& request,
                                    const core::CancelToken* cancel, bool created) {
    const auto start = std::chrono::steady_clock::now();
    const int workers = cfg_.runtime_limits.parallel_workers;
    RunOutcome outcome;

    events_.run_start(record.id,
                      {{"source_ref", record.source_ref},
                       {"prompt_version", record.prompt_version},
                       {"seed", record.seed}},
                      events_out_);
    log_ << "[run " << record.id << "] Processing " << (record.source_ref.empty() ? "<memory>" : record.source_ref)
         << std::endl;

    Stage stage = Stage::LOAD;
    std::string original_ref;
    storage::BlobRef processed_ref;
    try {
        events_.phase_start(record.id, stage, events_out_);
        LoadedImage loaded;
        if (request.image) {
            loaded.image = *request.image;
            loaded.bytes = request.source_bytes;
        } else {
            loaded = source_.load(request.source_ref);
        }
        loaded.image.validate();
        if (!record.original_width) record.original_width = loaded.image.width;
        if (!record.original_height) record.original_height = loaded.image.height;
        if (!record.original_filename && !loaded.filename.empty()) record.original_filename = loaded.filename;
        if (!record.original_format && !loaded.format.empty()) record.original_format = loaded.format;
        if (!loaded.bytes.empty()) {
            if (!record.original_size_bytes) {
                record.original_size_bytes = static_cast<int64_t>(loaded.bytes.size());
            }
            record.original_sha256 = core::sha256_bytes(loaded.bytes);
        }
        events_.phase_end(record.id, stage, "ok",
                          {{"width", loaded.image.width}, {"height", loaded.image.height}},
                          events_out_);
        const image::RgbaImage& original = loaded.image;
        check_stop(cancel);

        stage = Stage::CLASSIFY;
        events_.phase_start(record.id, stage, events_out_);
        const ClassMap classes = image::classify_pixels(original, workers);
        events_.phase_end(record.id, stage, "ok",
                          {{"ridge_pixels", classes.count(PixelClass::Ridge)},
                           {"valley_pixels", classes.count(PixelClass::Valley)}},
                          events_out_);
        check_stop(cancel);

        stage = Stage::SYNTHESIZE;
        events_.phase_start(record.id, stage, events_out_);
        image::RgbaImage textured = image::synthesize_texture(original, classes, record.seed, workers);
        image::verify_valley_invariant(textured, classes);
        events_.phase_end(record.id, stage, "ok", json::object(), events_out_);
        check_stop(cancel);

        stage = Stage::SHARPEN;
        events_.phase_start(record.id, stage, events_out_);
        const image::RgbaImage processed = image::sharpen(textured);
        events_.phase_end(record.id, stage, "ok", json::object(), events_out_);
        check_stop(cancel);

        stage = Stage::SCORE;
        events_.phase_start(record.id, stage, events_out_);
        const QualityMetrics metrics = metrics::score_quality(original, processed, cfg_.quality);
        events_.phase_end(record.id, stage, "ok", json(metrics), events_out_);
        check_stop(cancel);

        stage = Stage::STORE;
        events_.phase_start(record.id, stage, events_out_);
        const std::string case_id = record.case_id.value_or("");
        const std::string sample_id = record.sample_id.value_or("");
        if (record.source_ref.empty()) {
            const std::vector<uint8_t> original_png = io::encode_png(original);
            if (!record.original_sha256) record.original_sha256 = core::sha256_bytes(original_png);
            const storage::BlobRef up = blobs_.put(
                storage::make_forensic_key("original", record.original_filename.value_or("fingerprint.png"),
                                           case_id, sample_id),
                original_png, "image/png");
            record.source_ref = up.key;
            original_ref = up.url;
        } else if (request.image) {
            original_ref = record.source_ref;
        } else {
            original_ref = source_.locate(record.source_ref);
        }
        std::vector<uint8_t> png = io::encode_png(processed);
        record.processed_sha256 = core::sha256_bytes(png);
        std::string name = record.original_filename.value_or("fingerprint");
        const auto dot = name.find_last_of('.');
        if (dot != std::string::npos && dot > 0) name = name.substr(0, dot);
        processed_ref = blobs_.put(
            storage::make_forensic_key("processed", name + "_processed.png", case_id, sample_id),
            png, "image/png");
        record.processed_ref = processed_ref;
        record.metrics = metrics;
        outcome.png = std::move(png);
        events_.phase_end(record.id, stage, "ok",
                          {{"key", processed_ref.key}, {"url", processed_ref.url}}, events_out_);
    } catch (const std::exception& e) {
        const std::string kind = error_kind_of(e);
        events_.phase_end(record.id, stage, "error", {{"error", e.what()}}, events_out_);
        events_.error(record.id, e.what(), events_out_);
        log_ << "[run " << record.id << "] Error during " << stage_to_string(stage) << ": " << e.what()
             << std::endl;

        transition(record, RunStatus::Failed);
        record.error_message = e.what();
        record.error_kind = kind;
        record.processing_time_ms = core::elapsed_ms(start);
        record.completed_at = core::get_iso_timestamp();
        outcome.png.clear();
        outcome.persisted = persist(record, created);
        events_.run_end(record.id, false, kind, {{"processing_time_ms", record.processing_time_ms}},
                        events_out_);
        if (request.send_notification) send_notification(record);
        outcome.record = std::move(record);
        return outcome;
    }

    if (request.enable_oracle && oracle_) {
        record.processing_time_ms = core::elapsed_ms(start);
        consult_oracle(record, original_ref, processed_ref.url, cancel);
    }

    transition(record, RunStatus::Completed);
    record.processing_time_ms = core::elapsed_ms(start);
    record.completed_at = core::get_iso_timestamp();
    outcome.persisted = persist(record, created);
    events_.phase_start(record.id, Stage::DONE, events_out_);
    events_.phase_end(record.id, Stage::DONE, "ok", json::object(), events_out_);
    events_.run_end(record.id, true, "ok",
                    {{"processing_time_ms", record.processing_time_ms},
                     {"overall_score", record.metrics->overall_score}},
                    events_out_);
    log_ << "[run " << record.id << "] Completed in " << record.processing_time_ms
         << " ms, overall score " << record.metrics->overall_score << std::endl;

    if (request.send_notification) send_notification(record);
    outcome.record = std::move(record);
    return outcome;
}

void RunOrchestrator::consult_oracle(ProcessingRun& record, const std::string& original_ref,
                                     const std::string& processed_ref,
                                     const core::CancelToken* cancel) {
    events_.phase_start(record.id, Stage::ORACLE, events_out_);
    const int64_t elapsed = record.processing_time_ms;
    auto oracle = oracle_;
    auto result = core::run_bounded<OracleReport>(
        [oracle, original_ref, processed_ref, elapsed](const core::CancelToken& stop) {
            return oracle->assess(original_ref, processed_ref, elapsed, stop);
        },
        std::chrono::milliseconds(cfg_.oracle.timeout_ms), cancel, abandoned_);

    if (result.ok()) {
        record.oracle_report = std::move(*result.value);
        events_.phase_end(record.id, Stage::ORACLE, "ok",
                          {{"confidence", record.oracle_report->confidence}}, events_out_);
        return;
    }
    record.oracle_report.reset();
    const std::string status = core::task_status_to_string(result.status);
    events_.phase_end(record.id, Stage::ORACLE, status, {{"reason", result.reason}}, events_out_);
    events_.warning(record.id, "oracle " + status + ": " + result.reason, events_out_);
    log_ << "[run " << record.id << "] Warning: oracle " << status << ": " << result.reason
         << std::endl;
}

void RunOrchestrator::send_notification(const ProcessingRun& record) {
    if (!notifier_) return;
    events_.phase_start(record.id, Stage::NOTIFY, events_out_);
    const services::Notification note =
        services::build_notification(record, cfg_.notifier.perfect_score_threshold);
    auto notifier = notifier_;
    auto result = core::run_bounded<bool>(
        [notifier, note](const core::CancelToken& stop) {
            return notifier->notify(note.title, note.content, stop);
        },
        std::chrono::milliseconds(cfg_.notifier.timeout_ms), nullptr, abandoned_);

    std::string status = core::task_status_to_string(result.status);
    if (result.ok() && !*result.value) {
        status = "rejected";
        result.reason = "endpoint rejected the notification";
    }
    events_.phase_end(record.id, Stage::NOTIFY, status, {{"title", note.title}}, events_out_);
    if (status != "ok") {
        events_.warning(record.id, "notification " + status + ": " + result.reason, events_out_);
        log_ << "[run " << record.id << "] Warning: notification " << status << ": "
             << result.reason << std::endl;
    }
}

} // namespace ridge_texture::run
