#pragma once

#include "ridge_texture/run/run_record.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ridge_texture::storage {

namespace fs = std::filesystem;

struct ListQuery {
    int limit = 20;  // 1..100
    int offset = 0;  // >= 0
    std::optional<RunStatus> status;
    std::optional<std::string> case_id;

    // Throws ValidationError when limit/offset are out of range.
    void validate() const;
};

// Durable home of run records. Implementations lock per record so
// unrelated runs never wait on each other.
class RunStore {
public:
    virtual ~RunStore() = default;

    // Throws StateError if the id already exists.
    virtual void create(const run::ProcessingRun& run) = 0;
    // Replaces the stored record. Throws StateError when the stored record is
    // terminal or unknown.
    virtual void update(const run::ProcessingRun& run) = 0;
    virtual std::optional<run::ProcessingRun> get(const std::string& id) const = 0;
    // Newest first.
    virtual std::vector<run::ProcessingRun> list(const ListQuery& query) const = 0;
    virtual bool remove(const std::string& id) = 0;
};

class MemoryRunStore : public RunStore {
public:
    void create(const run::ProcessingRun& run) override;
    void update(const run::ProcessingRun& run) override;
    std::optional<run::ProcessingRun> get(const std::string& id) const override;
    std::vector<run::ProcessingRun> list(const ListQuery& query) const override;
    bool remove(const std::string& id) override;

private:
    struct Row {
        mutable std::mutex mutex;
        run::ProcessingRun record;
        uint64_t seq = 0;
    };

    std::shared_ptr<Row> find_row(const std::string& id) const;

    mutable std::shared_mutex map_mutex_;
    std::map<std::string, std::shared_ptr<Row>> rows_;
    uint64_t next_seq_ = 0;
};

// One `<runs_dir>/<id>/run.json` per record, replaced atomically on write.
// I/O failures surface as StoreUnavailable.
class FileRunStore : public RunStore {
public:
    explicit FileRunStore(fs::path runs_dir);

    void create(const run::ProcessingRun& run) override;
    void update(const run::ProcessingRun& run) override;
    std::optional<run::ProcessingRun> get(const std::string& id) const override;
    std::vector<run::ProcessingRun> list(const ListQuery& query) const override;
    bool remove(const std::string& id) override;

    fs::path record_path(const std::string& id) const;
    const fs::path& runs_dir() const { return runs_dir_; }
    // Number of ids with a live per-record lock.
    size_t lock_count() const;

private:
    std::shared_ptr<std::mutex> lock_for(const std::string& id) const;
    std::optional<run::ProcessingRun> read_record(const std::string& id) const;
    void write_record(const run::ProcessingRun& run) const;

    fs::path runs_dir_;
    mutable std::shared_mutex locks_mutex_;
    mutable std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};

// Filters, orders newest first (stable on created_at ties) and paginates.
std::vector<run::ProcessingRun> apply_query(std::vector<run::ProcessingRun> runs,
                                            const ListQuery& query);

} // namespace ridge_texture::storage
