// src/archive.cpp
#include "coord/archive.h"
#include "coord/errors.h"
#include "coord/id_generator.h"
#include "coord/log.h"
#include "coord/manifest.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace coord {

std::vector<fs::path> list_segment_files(const fs::path& archive_dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    if (!fs::is_directory(archive_dir, ec)) return out;

    for (const auto& de : fs::directory_iterator(archive_dir, ec)) {
        if (!de.is_regular_file()) continue;
        const auto& p = de.path();
        if (p.extension() != ".json") continue;
        if (p.filename() == "archive_manifest.json") continue;
        out.push_back(p);
    }
    if (ec) throw IoError("cannot list " + archive_dir.string() + ": " + ec.message());
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<WorkItem> load_segment(const fs::path& segment_file) {
    std::ifstream in(segment_file, std::ios::binary);
    if (!in) throw IoError("cannot open segment " + segment_file.string());

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw CorruptStoreError("cannot parse segment " + segment_file.string() + ": " + e.what());
    }
    if (!j.is_array()) throw CorruptStoreError("segment is not an array: " + segment_file.string());

    std::vector<WorkItem> items;
    items.reserve(j.size());
    for (const auto& rec : j) {
        WorkItem w = work_item_from_json(rec);
        // the original tool archived completed records as-is
        w.status = Status::Archived;
        items.push_back(std::move(w));
    }
    return items;
}

std::vector<WorkItem> load_archived_items(const fs::path& archive_dir) {
    std::vector<WorkItem> out;
    for (const auto& seg : list_segment_files(archive_dir)) {
        auto items = load_segment(seg);
        for (auto& w : items) out.push_back(std::move(w));
    }
    return out;
}

std::unordered_set<std::string> load_archived_ids(const fs::path& archive_dir) {
    std::unordered_set<std::string> ids;
    for (const auto& seg : list_segment_files(archive_dir)) {
        for (const auto& w : load_segment(seg)) ids.insert(w.id);
    }
    return ids;
}

ArchiveCompactor::ArchiveCompactor(const Config& cfg, const CanonicalStore& store, const Reconciler& reconciler)
    : archive_dir_(cfg.archive_dir()),
      max_items_per_segment_(std::max<uint32_t>(1, cfg.archive_segment_max_items)),
      store_(store),
      reconciler_(reconciler) {}

size_t ArchiveCompactor::optimize(TimePoint older_than) const {
    return optimize_with_stats(older_than).archived;
}

OptimizeStats ArchiveCompactor::optimize_with_stats(TimePoint older_than) const {
    OptimizeStats st;

    auto guard = store_.lock();
    WorkItemMap items = store_.load();

    // archiving never runs behind the fast log: a later replay would
    // otherwise resurrect ids that are no longer in the store
    const MergeResult merged = reconciler_.merge_pending(items);
    st.reconciled = merged.inserted;

    std::vector<std::string> selected;
    for (const auto& kv : items) {
        const WorkItem& w = kv.second;
        if (w.status != Status::Completed) continue;
        auto ts = parse_utc_iso(w.updated_at);
        if (!ts) {
            log_warn("skipping " + w.id + ": unparsable updated_at '" + w.updated_at + "'");
            continue;
        }
        if (*ts < older_than) selected.push_back(w.id);
    }

    const bool store_changed = merged.inserted > 0 || !selected.empty();
    if (!selected.empty()) {
        ensure_dirs(archive_dir_);
        const auto already = load_archived_ids(archive_dir_);

        std::vector<WorkItem> batch;
        for (const auto& id : selected) {
            if (already.count(id)) {
                ++st.recovered;
                continue;
            }
            WorkItem w = items.at(id);
            w.status = Status::Archived;
            w.updated_at = utc_now_iso();
            batch.push_back(std::move(w));
        }

        const std::string stamp = utc_now_compact();
        char salt[16];
        std::snprintf(salt, sizeof(salt), "%08x", (unsigned)(realtime_ns() & 0xffffffffu));

        for (size_t off = 0, seq = 0; off < batch.size(); off += max_items_per_segment_, ++seq) {
            const size_t n = std::min<size_t>(max_items_per_segment_, batch.size() - off);
            json arr = json::array();
            for (size_t i = 0; i < n; ++i) arr.push_back(to_json(batch[off + i]));

            SegmentEntry e;
            e.segment_name = "completed_" + stamp + "_" + std::to_string(seq) + "_" + salt;
            e.path = e.segment_name + ".json";
            e.built_at_utc = stamp;
            e.stats.items = n;

            write_file_atomic(archive_dir_ / e.path, arr.dump(2) + "\n");
            append_segment_to_manifest(archive_dir_, e);
            guard.heartbeat();

            st.segments.push_back(e.segment_name);
            st.archived += n;
        }

        for (const auto& id : selected) items.erase(id);
        if (st.recovered > 0) {
            log_warn("dropped " + std::to_string(st.recovered) +
                     " completed items that an interrupted optimize had already archived");
        }
    }

    if (store_changed) store_.save(items);
    if (merged.to_offset != merged.from_offset || merged.from_offset != reconciler_.load_checkpoint()) {
        reconciler_.commit_checkpoint(merged.to_offset);
    }

    if (st.archived > 0) {
        log_info("archived " + std::to_string(st.archived) + " items into " +
                 std::to_string(st.segments.size()) + " segment(s)");
    }
    return st;
}

} // namespace coord
