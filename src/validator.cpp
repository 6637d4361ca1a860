// src/validator.cpp
#include "coord/validator.h"
#include "coord/archive.h"
#include "coord/canonical_store.h"
#include "coord/errors.h"
#include "coord/fast_log.h"
#include "coord/manifest.h"
#include "coord/reconciler.h"

#include <filesystem>
#include <map>
#include <sstream>
#include <unordered_map>

namespace coord {

static void check_record(const WorkItem& w, const std::string& where, ValidationResult& vr) {
    if (w.progress < 0 || w.progress > 100) {
        vr.errors.push_back(where + ": progress out of range for " + w.id);
    }
    if (w.status == Status::Completed && w.completed_at.empty()) {
        vr.warnings.push_back(where + ": completed item without completed_at: " + w.id);
    }
}

ValidationResult validate_coordination_dir(const Config& cfg) {
    ValidationResult vr;
    std::unordered_map<std::string, std::string> seen; // id -> where

    CanonicalStore store(cfg);
    WorkItemMap items;
    try {
        items = store.load();
    } catch (const CoordException& e) {
        vr.errors.push_back(std::string("store: ") + e.what());
    }
    for (const auto& kv : items) {
        if (kv.second.status == Status::Archived) {
            vr.errors.push_back("store: archived item still in the active store: " + kv.first);
        }
        check_record(kv.second, "store", vr);
        seen.emplace(kv.first, "store");
    }

    // segments on disk vs manifest
    const auto archive_dir = cfg.archive_dir();
    std::map<std::string, uint64_t> on_disk; // file name -> items
    try {
        for (const auto& seg : list_segment_files(archive_dir)) {
            const std::string name = seg.filename().string();
            try {
                const auto segment = load_segment(seg);
                on_disk[name] = segment.size();
                for (const auto& w : segment) {
                    check_record(w, name, vr);
                    auto ins = seen.emplace(w.id, name);
                    if (!ins.second) {
                        vr.errors.push_back("id " + w.id + " appears in both " + ins.first->second + " and " + name);
                    }
                }
            } catch (const CoordException& e) {
                vr.errors.push_back(name + ": " + e.what());
            }
        }
    } catch (const CoordException& e) {
        vr.errors.push_back(std::string("archive: ") + e.what());
    }

    try {
        const Manifest m = load_manifest(archive_dir);
        for (const auto& s : m.segments) {
            auto it = on_disk.find(s.path);
            if (it == on_disk.end()) {
                vr.errors.push_back("manifest: segment file missing: " + s.path);
                continue;
            }
            if (it->second != s.stats.items) {
                std::ostringstream oss;
                oss << "manifest: item count mismatch for " << s.path
                    << ": manifest=" << s.stats.items << " file=" << it->second;
                vr.errors.push_back(oss.str());
            }
            on_disk.erase(it);
        }
        for (const auto& kv : on_disk) {
            // an optimize interrupted before its manifest update leaves these
            vr.warnings.push_back("segment not listed in manifest: " + kv.first);
        }
    } catch (const CoordException& e) {
        vr.errors.push_back(std::string("manifest: ") + e.what());
    }

    // fast log past the checkpoint
    FastAppendLog log(cfg);
    Reconciler rec(cfg, store, log);
    const uint64_t cp = rec.load_checkpoint();
    const uint64_t size = log.size();
    if (cp > size) {
        std::ostringstream oss;
        oss << "checkpoint " << cp << " beyond fast log size " << size;
        vr.errors.push_back(oss.str());
    } else {
        try {
            FastLogCursor cur = log.read_since(cp);
            FastLogEntry e;
            size_t pending = 0;
            while (cur.next(e)) {
                ++pending;
                auto it = seen.find(e.item.id);
                if (it != seen.end() && it->second != "store") {
                    vr.errors.push_back("unmerged fast-log id already archived in " + it->second + ": " + e.item.id);
                }
            }
            if (cur.skipped() > 0) {
                vr.errors.push_back("fast log: " + std::to_string(cur.skipped()) + " malformed line(s) past checkpoint");
            }
            if (pending > 0) {
                vr.warnings.push_back("fast log: " + std::to_string(pending) + " claim(s) awaiting reconciliation");
            }
        } catch (const CoordException& e) {
            vr.errors.push_back(std::string("fast log: ") + e.what());
        }
    }

    vr.ok = vr.errors.empty();
    return vr;
}

} // namespace coord
