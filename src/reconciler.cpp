// src/reconciler.cpp
#include "coord/reconciler.h"
#include "coord/archive.h"
#include "coord/errors.h"
#include "coord/format.h"
#include "coord/log.h"

#include <fstream>
#include <unordered_set>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace coord {

Reconciler::Reconciler(const Config& cfg, const CanonicalStore& store, const FastAppendLog& log)
    : checkpoint_path_(cfg.checkpoint_path()), archive_dir_(cfg.archive_dir()), store_(store), log_(log) {}

uint64_t Reconciler::load_checkpoint() const {
    std::ifstream in(checkpoint_path_);
    if (!in) return 0;
    try {
        json j;
        in >> j;
        return j.value("offset", (uint64_t)0);
    } catch (const json::exception& e) {
        log_warn("unreadable checkpoint " + checkpoint_path_.string() + ", replaying from 0: " + e.what());
        return 0;
    }
}

void Reconciler::commit_checkpoint(uint64_t offset) const {
    json j;
    j["offset"] = offset;
    j["updated_at"] = utc_now_iso();
    write_file_atomic(checkpoint_path_, j.dump() + "\n");
}

MergeResult Reconciler::merge_pending(WorkItemMap& items) const {
    MergeResult r;
    r.from_offset = load_checkpoint();

    // replaying from scratch may meet ids that were archived since
    std::unordered_set<std::string> archived;
    const uint64_t log_size = log_.size();
    if (r.from_offset > log_size) {
        log_warn("checkpoint " + std::to_string(r.from_offset) + " is past the end of " +
                 log_.path().string() + " (" + std::to_string(log_size) + " bytes), replaying from 0");
        r.from_offset = 0;
    }
    if (r.from_offset == 0) archived = load_archived_ids(archive_dir_);

    FastLogCursor cur = log_.read_since(r.from_offset);
    FastLogEntry e;
    while (cur.next(e)) {
        if (items.count(e.item.id) || archived.count(e.item.id)) {
            ++r.conflicts;
            log_warn(ReconciliationConflictError(e.item.id).what());
            continue;
        }
        WorkItem w = std::move(e.item);
        w.status = Status::Active;
        items.emplace(w.id, std::move(w));
        ++r.inserted;
    }
    r.skipped = cur.skipped();
    r.to_offset = cur.position();
    return r;
}

size_t Reconciler::reconcile() const {
    auto guard = store_.lock();
    WorkItemMap items = store_.load();

    const MergeResult r = merge_pending(items);
    if (r.inserted > 0) store_.save(items);
    if (r.to_offset != r.from_offset || r.from_offset != load_checkpoint()) commit_checkpoint(r.to_offset);

    if (r.inserted > 0 || r.conflicts > 0) {
        log_info("reconciled " + std::to_string(r.inserted) + " fast-path claims (" +
                 std::to_string(r.conflicts) + " duplicates dropped)");
    }
    return r.inserted;
}

} // namespace coord
