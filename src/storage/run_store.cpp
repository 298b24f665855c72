#include "ridge_texture/storage/run_store.hpp"
#include "ridge_texture/core/errors.hpp"
#include "ridge_texture/core/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace ridge_texture::storage {

void ListQuery::validate() const {
    if (limit < 1 || limit > 100) {
        throw ValidationError("list limit must be in [1, 100], got " + std::to_string(limit));
    }
    if (offset < 0) {
        throw ValidationError("list offset must be >= 0, got " + std::to_string(offset));
    }
}

namespace {

bool matches(const run::ProcessingRun& r, const ListQuery& q) {
    if (q.status && r.status != *q.status) return false;
    if (q.case_id && (!r.case_id || *r.case_id != *q.case_id)) return false;
    return true;
}

void check_id(const std::string& id) {
    if (id.empty() || id.find('/') != std::string::npos || id.find('\\') != std::string::npos ||
        id == "." || id == "..") {
        throw ValidationError("invalid run id '" + id + "'");
    }
}

} // namespace

std::vector<run::ProcessingRun> apply_query(std::vector<run::ProcessingRun> runs,
                                            const ListQuery& query) {
    query.validate();
    runs.erase(std::remove_if(runs.begin(), runs.end(),
                              [&](const run::ProcessingRun& r) { return !matches(r, query); }),
               runs.end());
    std::stable_sort(runs.begin(), runs.end(),
                     [](const run::ProcessingRun& a, const run::ProcessingRun& b) {
                         return a.created_at > b.created_at;
                     });
    const size_t begin = std::min(runs.size(), static_cast<size_t>(query.offset));
    const size_t end = std::min(runs.size(), begin + static_cast<size_t>(query.limit));
    return std::vector<run::ProcessingRun>(runs.begin() + static_cast<std::ptrdiff_t>(begin),
                                           runs.begin() + static_cast<std::ptrdiff_t>(end));
}

// ---------------------------------------------------------------------------
// MemoryRunStore

std::shared_ptr<MemoryRunStore::Row> MemoryRunStore::find_row(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = rows_.find(id);
    return it == rows_.end() ? nullptr : it->second;
}

void MemoryRunStore::create(const run::ProcessingRun& run) {
    check_id(run.id);
    auto row = std::make_shared<Row>();
    row->record = run;
    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    if (rows_.count(run.id)) {
        throw StateError("run " + run.id + " already exists");
    }
    row->seq = next_seq_++;
    rows_.emplace(run.id, std::move(row));
}

void MemoryRunStore::update(const run::ProcessingRun& run) {
    auto row = find_row(run.id);
    if (!row) {
        throw StateError("run " + run.id + " does not exist");
    }
    std::lock_guard<std::mutex> lock(row->mutex);
    if (is_terminal(row->record.status)) {
        throw StateError("run " + run.id + " is " + run_status_to_string(row->record.status) +
                         " and can no longer change");
    }
    row->record = run;
}

std::optional<run::ProcessingRun> MemoryRunStore::get(const std::string& id) const {
    auto row = find_row(id);
    if (!row) return std::nullopt;
    std::lock_guard<std::mutex> lock(row->mutex);
    return row->record;
}

std::vector<run::ProcessingRun> MemoryRunStore::list(const ListQuery& query) const {
    query.validate();
    std::vector<std::pair<uint64_t, run::ProcessingRun>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        snapshot.reserve(rows_.size());
        for (const auto& kv : rows_) {
            std::lock_guard<std::mutex> row_lock(kv.second->mutex);
            snapshot.emplace_back(kv.second->seq, kv.second->record);
        }
    }
    // Insertion order breaks created_at ties.
    std::sort(snapshot.begin(), snapshot.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });
    std::vector<run::ProcessingRun> runs;
    runs.reserve(snapshot.size());
    for (auto& s : snapshot) runs.push_back(std::move(s.second));

    return apply_query(std::move(runs), query);
}

bool MemoryRunStore::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    return rows_.erase(id) > 0;
}

// ---------------------------------------------------------------------------
// FileRunStore

FileRunStore::FileRunStore(fs::path runs_dir) : runs_dir_(std::move(runs_dir)) {}

fs::path FileRunStore::record_path(const std::string& id) const {
    return runs_dir_ / id / "run.json";
}

std::shared_ptr<std::mutex> FileRunStore::lock_for(const std::string& id) const {
    {
        std::shared_lock<std::shared_mutex> lock(locks_mutex_);
        auto it = locks_.find(id);
        if (it != locks_.end()) return it->second;
    }
    std::unique_lock<std::shared_mutex> lock(locks_mutex_);
    auto& slot = locks_[id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

std::optional<run::ProcessingRun> FileRunStore::read_record(const std::string& id) const {
    const fs::path p = record_path(id);
    std::error_code ec;
    if (!fs::exists(p, ec)) {
        if (ec) throw StoreUnavailable("cannot stat " + p.string() + ": " + ec.message());
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(core::read_text(p)).get<run::ProcessingRun>();
    } catch (const IOError& e) {
        throw StoreUnavailable(e.what());
    } catch (const nlohmann::json::exception& e) {
        throw StoreUnavailable("corrupt record " + p.string() + ": " + e.what());
    }
}

void FileRunStore::write_record(const run::ProcessingRun& run) const {
    const fs::path p = record_path(run.id);
    try {
        fs::create_directories(p.parent_path());
        core::write_text_atomic(p, nlohmann::json(run).dump(2) + "\n");
    } catch (const fs::filesystem_error& e) {
        throw StoreUnavailable(e.what());
    } catch (const IOError& e) {
        throw StoreUnavailable(e.what());
    }
}

void FileRunStore::create(const run::ProcessingRun& run) {
    check_id(run.id);
    auto m = lock_for(run.id);
    std::lock_guard<std::mutex> lock(*m);
    if (read_record(run.id)) {
        throw StateError("run " + run.id + " already exists");
    }
    write_record(run);
}

void FileRunStore::update(const run::ProcessingRun& run) {
    check_id(run.id);
    auto m = lock_for(run.id);
    std::lock_guard<std::mutex> lock(*m);
    auto stored = read_record(run.id);
    if (!stored) {
        throw StateError("run " + run.id + " does not exist");
    }
    if (is_terminal(stored->status)) {
        throw StateError("run " + run.id + " is " + run_status_to_string(stored->status) +
                         " and can no longer change");
    }
    write_record(run);
}

std::optional<run::ProcessingRun> FileRunStore::get(const std::string& id) const {
    check_id(id);
    auto m = lock_for(id);
    std::lock_guard<std::mutex> lock(*m);
    return read_record(id);
}

std::vector<run::ProcessingRun> FileRunStore::list(const ListQuery& query) const {
    query.validate();
    std::vector<run::ProcessingRun> runs;
    std::error_code ec;
    if (!fs::exists(runs_dir_, ec)) {
        return runs;
    }
    try {
        for (const auto& entry : fs::directory_iterator(runs_dir_)) {
            if (!entry.is_directory()) continue;
            const std::string id = entry.path().filename().string();
            if (!fs::exists(entry.path() / "run.json")) continue;
            if (auto r = get(id)) runs.push_back(std::move(*r));
        }
    } catch (const fs::filesystem_error& e) {
        throw StoreUnavailable(e.what());
    }
    // Directory order is unspecified; ids start with a timestamp.
    std::sort(runs.begin(), runs.end(),
              [](const run::ProcessingRun& a, const run::ProcessingRun& b) { return a.id > b.id; });
    return apply_query(std::move(runs), query);
}

bool FileRunStore::remove(const std::string& id) {
    check_id(id);
    auto m = lock_for(id);
    std::lock_guard<std::mutex> lock(*m);
    std::error_code ec;
    const auto removed = fs::remove_all(runs_dir_ / id, ec);
    if (ec) {
        throw StoreUnavailable("cannot remove run " + id + ": " + ec.message());
    }
    {
        std::unique_lock<std::shared_mutex> map_lock(locks_mutex_);
        auto it = locks_.find(id);
        if (it != locks_.end() && it->second == m) locks_.erase(it);
    }
    return removed > 0;
}

size_t FileRunStore::lock_count() const {
    std::shared_lock<std::shared_mutex> lock(locks_mutex_);
    return locks_.size();
}

} // namespace ridge_texture::storage
