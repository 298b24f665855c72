#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/utils.hpp"
#include "ridge_texture/io/image_codec.hpp"
#include "ridge_texture/run/orchestrator.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <thread>

using ridge_texture::OracleReport;
using ridge_texture::RunStatus;
using ridge_texture::core::CancelToken;
using ridge_texture::core::EventEmitter;
using ridge_texture::image::RgbaImage;
using ridge_texture::run::FileImageSource;
using ridge_texture::run::ProcessingRun;
using ridge_texture::run::RunOrchestrator;
using ridge_texture::run::RunOutcome;
using ridge_texture::run::RunRequest;
using ridge_texture::storage::BlobRef;
using ridge_texture::storage::ListQuery;
using ridge_texture::storage::LocalBlobStore;
using ridge_texture::storage::MemoryRunStore;
namespace config = ridge_texture::config;
namespace core = ridge_texture::core;

namespace {

class ScriptedOracle : public ridge_texture::services::QualityOracle {
public:
    enum class Mode { Answer, Throw, Hang };
    explicit ScriptedOracle(Mode mode) : mode_(mode) {}

    OracleReport assess(const std::string &original_ref, const std::string &processed_ref,
                        int64_t, const CancelToken &stop) override {
        calls++;
        last_original = original_ref;
        last_processed = processed_ref;
        if (mode_ == Mode::Throw) throw ridge_texture::OracleUnavailable("HTTP 500");
        if (mode_ == Mode::Hang) {
            // Holds the call open like a stalled endpoint until told to stop.
            const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (!stop.stop_requested() && std::chrono::steady_clock::now() < give_up) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            saw_stop = stop.stop_requested();
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            returned = true;
            throw ridge_texture::OracleUnavailable("aborted");
        }
        OracleReport r;
        r.assessment = "Clean valleys";
        r.confidence = 0.97;
        return r;
    }

    std::atomic<int> calls{0};
    std::atomic<bool> saw_stop{false};
    std::atomic<bool> returned{false};
    std::string last_original;
    std::string last_processed;

private:
    Mode mode_;
};

class RecordingNotifier : public ridge_texture::services::Notifier {
public:
    explicit RecordingNotifier(bool fail) : fail_(fail) {}

    bool notify(const std::string &title, const std::string &, const CancelToken &) override {
        last_title = title;
        calls++;
        if (fail_) throw ridge_texture::NotificationFailed("connection refused");
        return true;
    }

    std::atomic<int> calls{0};
    std::string last_title;

private:
    bool fail_;
};

// Fails every write, as an unreachable database would.
class DownRunStore : public ridge_texture::storage::RunStore {
public:
    void create(const ProcessingRun &) override { throw ridge_texture::StoreUnavailable("down"); }
    void update(const ProcessingRun &) override { throw ridge_texture::StoreUnavailable("down"); }
    std::optional<ProcessingRun> get(const std::string &) const override { return std::nullopt; }
    std::vector<ProcessingRun> list(const ListQuery &) const override { return {}; }
    bool remove(const std::string &) override { return false; }
};

// Accepts new records, then refuses every update as if the record had been
// deleted in the meantime.
class DeletedRecordStore : public ridge_texture::storage::RunStore {
public:
    void create(const ProcessingRun &) override { creates++; }
    void update(const ProcessingRun &run) override {
        throw ridge_texture::StateError("run " + run.id + " does not exist");
    }
    std::optional<ProcessingRun> get(const std::string &) const override { return std::nullopt; }
    std::vector<ProcessingRun> list(const ListQuery &) const override { return {}; }
    bool remove(const std::string &) override { return false; }

    int creates = 0;
};

// Deletes every stored run while the oracle call is in flight.
class DeletingOracle : public ridge_texture::services::QualityOracle {
public:
    explicit DeletingOracle(MemoryRunStore &store) : store_(store) {}

    OracleReport assess(const std::string &, const std::string &, int64_t,
                        const CancelToken &) override {
        for (const auto &r : store_.list(ListQuery{})) store_.remove(r.id);
        OracleReport report;
        report.confidence = 0.5;
        return report;
    }

private:
    MemoryRunStore &store_;
};

class FailingBlobStore : public ridge_texture::storage::BlobStore {
public:
    BlobRef put(const std::string &key, const std::vector<uint8_t> &,
                const std::string &) override {
        throw ridge_texture::StorageError("bucket unreachable for " + key);
    }
    BlobRef get(const std::string &key) const override {
        throw ridge_texture::StorageError("bucket unreachable for " + key);
    }
};

struct Harness {
    ridge_texture::testing::TempDir dir;
    config::Config cfg;
    MemoryRunStore store;
    std::unique_ptr<LocalBlobStore> blobs;
    std::unique_ptr<FileImageSource> source;
    EventEmitter emitter;
    std::ostringstream events;
    std::ostringstream log;

    Harness() {
        cfg.oracle.timeout_ms = 60;
        cfg.notifier.timeout_ms = 200;
        cfg.runtime_limits.parallel_workers = 2;
        blobs = std::make_unique<LocalBlobStore>(dir.path() / "blobs");
        source = std::make_unique<FileImageSource>(dir.path() / "blobs");
    }

    RunOrchestrator make(ridge_texture::storage::RunStore &s,
                         std::shared_ptr<ridge_texture::services::QualityOracle> oracle = nullptr,
                         std::shared_ptr<ridge_texture::services::Notifier> notifier = nullptr) {
        return RunOrchestrator(cfg, s, *blobs, *source, std::move(oracle), std::move(notifier),
                               emitter, events, log);
    }

    std::string write_source(const RgbaImage &img, const std::string &name = "print.png") {
        const auto p = dir.path() / name;
        core::write_bytes(p, ridge_texture::io::encode_png(img));
        return p.string();
    }
};

RunRequest request_for(const std::string &path) {
    RunRequest req;
    req.source_ref = path;
    req.case_id = "CASE-1";
    req.seed = 17;
    return req;
}

} // namespace

TEST_CASE("orchestrator_completes_run_and_stores_processed_image") {
    Harness h;
    auto orch = h.make(h.store);
    const RgbaImage src = ridge_texture::testing::stripes(32, 24, 3, 3, 45);
    const std::string path = h.write_source(src);

    const RunOutcome out = orch.submit(request_for(path));
    REQUIRE(out.persisted);
    REQUIRE(out.record.status == RunStatus::Completed);
    REQUIRE(out.record.metrics.has_value());
    REQUIRE(out.record.metrics->background_cleanness == Catch::Approx(1.0));
    REQUIRE(out.record.processed_ref.has_value());
    REQUIRE(core::starts_with(out.record.processed_ref->key, "forensic/case-CASE-1/processed/"));
    REQUIRE(out.record.completed_at.has_value());
    REQUIRE(out.record.original_width == 32);
    REQUIRE(out.record.original_height == 24);
    REQUIRE(out.record.original_sha256 == core::sha256_bytes(core::read_bytes(path)));
    REQUIRE(out.record.processed_sha256 == core::sha256_bytes(out.png));
    REQUIRE_FALSE(out.record.oracle_report.has_value());

    const auto stored_png = core::read_bytes(h.blobs->path_for(out.record.processed_ref->key));
    REQUIRE(stored_png == out.png);

    const auto stored = h.store.get(out.record.id);
    REQUIRE(stored.has_value());
    REQUIRE(stored->status == RunStatus::Completed);

    REQUIRE(h.events.str().find("\"run_end\"") != std::string::npos);
}

TEST_CASE("orchestrator_output_is_reproducible_for_recorded_seed") {
    Harness h;
    auto orch = h.make(h.store);
    const std::string path = h.write_source(ridge_texture::testing::stripes(20, 20, 2, 3, 80));

    const RunOutcome a = orch.submit(request_for(path));
    const RunOutcome b = orch.submit(request_for(path));
    REQUIRE(a.record.seed == 17u);
    REQUIRE(a.png == b.png);
    REQUIRE(a.record.id != b.record.id);
}

TEST_CASE("orchestrator_fails_run_on_invalid_image") {
    Harness h;
    auto orch = h.make(h.store);
    const std::string junk = "definitely not a png";
    core::write_bytes(h.dir.path() / "junk.png", std::vector<uint8_t>(junk.begin(), junk.end()));

    const RunOutcome out = orch.submit(request_for((h.dir.path() / "junk.png").string()));
    REQUIRE(out.record.status == RunStatus::Failed);
    REQUIRE(out.record.error_kind == std::optional<std::string>("invalid_image"));
    REQUIRE(out.record.error_message.has_value());
    REQUIRE_FALSE(out.record.processed_ref.has_value());
    REQUIRE(out.png.empty());
    REQUIRE(h.store.get(out.record.id)->status == RunStatus::Failed);
}

TEST_CASE("orchestrator_fails_run_when_stop_requested") {
    Harness h;
    auto orch = h.make(h.store);
    const std::string path = h.write_source(ridge_texture::testing::checkerboard(8, 8));
    CancelToken token;
    token.request_stop();

    const RunOutcome out = orch.submit(request_for(path), &token);
    REQUIRE(out.record.status == RunStatus::Failed);
    REQUIRE(out.record.error_kind == std::optional<std::string>("stop_requested"));
    REQUIRE(out.record.error_message == std::optional<std::string>("Stop requested by caller"));
}

TEST_CASE("orchestrator_attaches_oracle_report") {
    Harness h;
    auto oracle = std::make_shared<ScriptedOracle>(ScriptedOracle::Mode::Answer);
    h.cfg.oracle.timeout_ms = 2000;
    auto orch = h.make(h.store, oracle);
    const std::string path = h.write_source(ridge_texture::testing::stripes(16, 16, 2, 2, 30));

    const RunOutcome out = orch.submit(request_for(path));
    REQUIRE(out.record.status == RunStatus::Completed);
    REQUIRE(out.record.oracle_report.has_value());
    REQUIRE(out.record.oracle_report->assessment == "Clean valleys");
    REQUIRE(oracle->last_processed == out.record.processed_ref->url);
}

TEST_CASE("orchestrator_skips_oracle_when_request_disables_it") {
    Harness h;
    auto oracle = std::make_shared<ScriptedOracle>(ScriptedOracle::Mode::Answer);
    auto orch = h.make(h.store, oracle);
    RunRequest req = request_for(h.write_source(RgbaImage::filled(4, 4, 0, 0, 0)));
    req.enable_oracle = false;

    const RunOutcome out = orch.submit(req);
    REQUIRE(out.record.status == RunStatus::Completed);
    REQUIRE(oracle->calls == 0);
}

TEST_CASE("orchestrator_neutralises_oracle_failure_and_timeout") {
    for (auto mode : {ScriptedOracle::Mode::Throw, ScriptedOracle::Mode::Hang}) {
        Harness h;
        auto orch = h.make(h.store, std::make_shared<ScriptedOracle>(mode));
        const std::string path = h.write_source(ridge_texture::testing::checkerboard(6, 6));

        const RunOutcome out = orch.submit(request_for(path));
        REQUIRE(out.record.status == RunStatus::Completed);
        REQUIRE_FALSE(out.record.oracle_report.has_value());
        REQUIRE(out.record.metrics.has_value());
        REQUIRE(h.events.str().find("\"warning\"") != std::string::npos);
    }
}

TEST_CASE("orchestrator_cancel_during_oracle_completes_without_report") {
    Harness h;
    h.cfg.oracle.timeout_ms = 5000;
    auto orch = h.make(h.store, std::make_shared<ScriptedOracle>(ScriptedOracle::Mode::Hang));
    const std::string path = h.write_source(ridge_texture::testing::checkerboard(6, 6));
    CancelToken token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        token.request_stop();
    });
    const RunOutcome out = orch.submit(request_for(path), &token);
    canceller.join();

    // The pixel stages on a 6x6 image finish long before the cancel fires.
    REQUIRE(out.record.status == RunStatus::Completed);
    REQUIRE_FALSE(out.record.oracle_report.has_value());
}

TEST_CASE("orchestrator_notifier_failure_is_not_fatal") {
    Harness h;
    auto notifier = std::make_shared<RecordingNotifier>(true);
    auto orch = h.make(h.store, nullptr, notifier);
    const std::string path = h.write_source(ridge_texture::testing::stripes(12, 12, 2, 2, 20));

    const RunOutcome out = orch.submit(request_for(path));
    REQUIRE(out.record.status == RunStatus::Completed);
    REQUIRE(notifier->calls == 1);
    REQUIRE(core::starts_with(notifier->last_title, "PROCESSING"));
}

TEST_CASE("orchestrator_reports_unpersisted_outcome_when_store_is_down") {
    Harness h;
    DownRunStore down;
    auto orch = h.make(down);
    const std::string path = h.write_source(ridge_texture::testing::checkerboard(4, 4));

    const RunOutcome out = orch.submit(request_for(path));
    REQUIRE(out.record.status == RunStatus::Completed);
    REQUIRE_FALSE(out.persisted);
    REQUIRE_FALSE(out.png.empty());
}

TEST_CASE("orchestrator_uploads_in_memory_original") {
    Harness h;
    auto orch = h.make(h.store);
    RunRequest req;
    req.image = ridge_texture::testing::checkerboard(5, 5);
    req.sample_id = "S-3";

    const RunOutcome out = orch.submit(req);
    REQUIRE(out.record.status == RunStatus::Completed);
    REQUIRE(core::starts_with(out.record.source_ref, "forensic/sample-S-3/original/"));
    REQUIRE(std::filesystem::exists(h.blobs->path_for(out.record.source_ref)));
}

TEST_CASE("orchestrator_enqueue_then_claim") {
    Harness h;
    auto orch = h.make(h.store);
    const std::string path = h.write_source(ridge_texture::testing::stripes(10, 10, 2, 2, 60));

    const ProcessingRun pending = orch.enqueue(request_for(path));
    REQUIRE(pending.status == RunStatus::Pending);
    REQUIRE(h.store.get(pending.id)->status == RunStatus::Pending);

    const RunOutcome out = orch.claim(pending.id);
    REQUIRE(out.record.id == pending.id);
    REQUIRE(out.record.status == RunStatus::Completed);
    REQUIRE(out.record.seed == 17u);

    REQUIRE_THROWS_AS(orch.claim(pending.id), ridge_texture::StateError);
    REQUIRE_THROWS_AS(orch.claim("missing"), ridge_texture::StateError);
    REQUIRE_THROWS_AS(orch.enqueue(RunRequest{}), ridge_texture::ValidationError);
}

TEST_CASE("orchestrator_fails_run_on_mismatched_pixel_buffer") {
    Harness h;
    auto orch = h.make(h.store);
    RunRequest req;
    req.image = RgbaImage(4, 4, std::vector<uint8_t>(63));
    req.case_id = "CASE-2";

    const RunOutcome out = orch.submit(req);
    REQUIRE(out.record.status == RunStatus::Failed);
    REQUIRE(out.record.error_kind == std::optional<std::string>("invalid_image"));
    REQUIRE(out.png.empty());
    REQUIRE_FALSE(out.record.processed_ref.has_value());
    REQUIRE(h.store.get(out.record.id)->status == RunStatus::Failed);
}

TEST_CASE("orchestrator_fails_run_when_blob_store_rejects_upload") {
    Harness h;
    FailingBlobStore failing;
    auto notifier = std::make_shared<RecordingNotifier>(false);
    RunOrchestrator orch(h.cfg, h.store, failing, *h.source, nullptr, notifier, h.emitter,
                         h.events, h.log);
    const std::string path = h.write_source(ridge_texture::testing::stripes(12, 12, 2, 2, 40));

    const RunOutcome out = orch.submit(request_for(path));
    REQUIRE(out.record.status == RunStatus::Failed);
    REQUIRE(out.record.error_kind == std::optional<std::string>("storage_error"));
    REQUIRE(out.png.empty());
    REQUIRE_FALSE(out.record.processed_ref.has_value());
    REQUIRE(out.persisted);
    REQUIRE(h.store.get(out.record.id)->status == RunStatus::Failed);
    REQUIRE(notifier->last_title == "PROCESSING FAILED");
}

TEST_CASE("orchestrator_returns_outcome_when_record_deleted_mid_run") {
    Harness h;
    h.cfg.oracle.timeout_ms = 2000;
    auto orch = h.make(h.store, std::make_shared<DeletingOracle>(h.store));
    const std::string path = h.write_source(ridge_texture::testing::stripes(12, 12, 2, 2, 40));

    RunOutcome out;
    REQUIRE_NOTHROW(out = orch.submit(request_for(path)));
    REQUIRE(out.record.status == RunStatus::Completed);
    REQUIRE_FALSE(out.persisted);
    REQUIRE_FALSE(out.png.empty());
    REQUIRE_FALSE(h.store.get(out.record.id).has_value());
    REQUIRE(h.events.str().find("\"warning\"") != std::string::npos);
}

TEST_CASE("orchestrator_failed_run_survives_rejected_update") {
    Harness h;
    DeletedRecordStore store;
    auto orch = h.make(store);
    RunRequest req;
    req.image = RgbaImage(3, 3, std::vector<uint8_t>(5));

    RunOutcome out;
    REQUIRE_NOTHROW(out = orch.submit(req));
    REQUIRE(store.creates == 1);
    REQUIRE(out.record.status == RunStatus::Failed);
    REQUIRE(out.record.error_kind == std::optional<std::string>("invalid_image"));
    REQUIRE_FALSE(out.persisted);
}

TEST_CASE("orchestrator_joins_timed_out_oracle_call") {
    Harness h;
    auto oracle = std::make_shared<ScriptedOracle>(ScriptedOracle::Mode::Hang);
    const std::string path = h.write_source(ridge_texture::testing::checkerboard(6, 6));
    {
        auto orch = h.make(h.store, oracle);
        const RunOutcome out = orch.submit(request_for(path));
        REQUIRE(out.record.status == RunStatus::Completed);
        REQUIRE_FALSE(out.record.oracle_report.has_value());
    }
    REQUIRE(oracle->returned);
    REQUIRE(oracle->saw_stop);
}

TEST_CASE("orchestrator_rejects_invalid_config") {
    Harness h;
    h.cfg.quality.block_size = 0;
    REQUIRE_THROWS_AS(h.make(h.store), ridge_texture::ValidationError);
}
