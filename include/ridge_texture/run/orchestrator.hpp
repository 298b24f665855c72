#pragma once

#include "ridge_texture/config/configuration.hpp"
#include "ridge_texture/core/bounded_task.hpp"
#include "ridge_texture/core/cancellation.hpp"
#include "ridge_texture/core/events.hpp"
#include "ridge_texture/image/rgba_image.hpp"
#include "ridge_texture/run/image_source.hpp"
#include "ridge_texture/run/run_record.hpp"
#include "ridge_texture/services/notifier.hpp"
#include "ridge_texture/services/oracle.hpp"
#include "ridge_texture/storage/blob_store.hpp"
#include "ridge_texture/storage/run_store.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ridge_texture::run {

struct RunRequest {
    // Path or blob key of the source. May be empty when `image` is given;
    // the original is then uploaded next to the processed image.
    std::string source_ref;
    std::optional<image::RgbaImage> image;
    std::vector<uint8_t> source_bytes;

    std::optional<std::string> case_id;
    std::optional<std::string> sample_id;
    std::optional<std::string> original_filename;
    std::optional<std::string> original_format;
    std::optional<int> original_width;
    std::optional<int> original_height;
    std::optional<int64_t> original_size_bytes;

    bool enable_oracle = true;
    bool send_notification = true;
    std::optional<uint64_t> seed;
};

struct RunOutcome {
    ProcessingRun record;
    std::vector<uint8_t> png; // empty unless Completed
    bool persisted = true;    // false if any run-store write failed
};

// Drives one fingerprint through classify, synthesize, sharpen, score and
// store, then the optional oracle and notifier. Every call that starts a run
// returns a terminal record; stage errors end in Failed, never in a throw.
// Oracle and notifier calls that outlive their wait are joined on
// destruction. The constructor throws ValidationError for an invalid `cfg`.
class RunOrchestrator {
public:
    RunOrchestrator(const config::Config& cfg, storage::RunStore& store,
                    storage::BlobStore& blobs, const ImageSource& source,
                    std::shared_ptr<services::QualityOracle> oracle,
                    std::shared_ptr<services::Notifier> notifier,
                    core::EventEmitter& events, std::ostream& events_out,
                    std::ostream& log);

    RunOutcome submit(const RunRequest& request, const core::CancelToken* cancel = nullptr);

    // Stores a Pending record for later processing. Throws ValidationError
    // without a source reference; StoreUnavailable propagates.
    ProcessingRun enqueue(const RunRequest& request);

    // Processes a Pending run. Throws StateError for unknown or non-pending
    // runs.
    RunOutcome claim(const std::string& run_id, const core::CancelToken* cancel = nullptr);

private:
    ProcessingRun new_record(const RunRequest& request, RunStatus status) const;
    uint64_t pick_seed(const RunRequest& request) const;

    RunOutcome execute(ProcessingRun record, const RunRequest& request,
                       const core::CancelToken* cancel, bool created);
    void consult_oracle(ProcessingRun& record, const std::string& original_ref,
                        const std::string& processed_ref, const core::CancelToken* cancel);
    void send_notification(const ProcessingRun& record);

    // Writes the record. A store that is down, or that no longer accepts the
    // record, gives a warning and `false`.
    bool persist(const ProcessingRun& record, bool created);

    const config::Config& cfg_;
    storage::RunStore& store_;
    storage::BlobStore& blobs_;
    const ImageSource& source_;
    std::shared_ptr<services::QualityOracle> oracle_;
    std::shared_ptr<services::Notifier> notifier_;
    core::EventEmitter& events_;
    std::ostream& events_out_;
    std::ostream& log_;
    core::TaskGroup abandoned_;
};

} // namespace ridge_texture::run
