// src/canonical_store.cpp
#include "coord/canonical_store.h"
#include "coord/errors.h"
#include "coord/format.h"
#include "coord/log.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace coord {

WorkItemMap parse_store_json(const std::string& text, const std::string& origin) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        throw CorruptStoreError("cannot parse " + origin + ": " + e.what());
    }

    WorkItemMap out;
    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            WorkItem w = work_item_from_json(it.value());
            if (w.id != it.key()) {
                throw CorruptStoreError(origin + ": key " + it.key() + " holds record " + w.id);
            }
            out.emplace(w.id, std::move(w));
        }
        return out;
    }

    // the original tool kept a plain array of claims
    if (j.is_array()) {
        for (const auto& rec : j) {
            WorkItem w = work_item_from_json(rec);
            if (!out.emplace(w.id, w).second) {
                throw CorruptStoreError(origin + ": id appears twice: " + w.id);
            }
        }
        return out;
    }

    throw CorruptStoreError(origin + ": root is neither an object nor an array");
}

std::string dump_store_json(const WorkItemMap& items) {
    json j = json::object();
    for (const auto& kv : items) j[kv.first] = to_json(kv.second);
    return j.dump(2) + "\n";
}

CanonicalStore::CanonicalStore(const Config& cfg)
    : path_(cfg.claims_path()), lock_path_(cfg.lock_path()), lock_opt_(lock_options_from(cfg)) {}

WorkItemMap CanonicalStore::load() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!fs::exists(path_, ec)) return {};
        throw IoError("cannot open " + path_.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw IoError("read failed: " + path_.string());
    return parse_store_json(ss.str(), path_.string());
}

void CanonicalStore::save(const WorkItemMap& items) const {
    ensure_dirs(path_.parent_path());
    write_file_atomic(path_, dump_store_json(items));
}

ScopedLock CanonicalStore::lock() const {
    return ScopedLock(lock_path_, lock_opt_);
}

bool CanonicalStore::contains(const std::string& id) const {
    const auto items = load();
    return items.find(id) != items.end();
}

WorkItem CanonicalStore::mutate(const std::string& id,
                                const MutateFn& fn,
                                const std::vector<Status>& expected_from,
                                const SavedFn& on_saved) const {
    auto guard = lock();
    WorkItemMap items = load();

    auto it = items.find(id);
    if (it == items.end()) throw NotFoundError(id);

    const Status from = it->second.status;
    if (std::find(expected_from.begin(), expected_from.end(), from) == expected_from.end()) {
        throw InvalidTransitionError("work item " + id + " is " + to_string(from) +
                                     ", operation not allowed in this status");
    }

    WorkItem next = it->second;
    fn(next);

    if (next.id != id) throw InvalidTransitionError("work item id cannot change: " + id);
    if (!is_legal_transition(from, next.status)) {
        throw InvalidTransitionError(std::string("illegal transition ") + to_string(from) + " -> " +
                                     to_string(next.status) + " for " + id);
    }
    if (next.progress < 0 || next.progress > 100) {
        throw InvalidArgumentError("progress must be within 0..100");
    }
    next.updated_at = utc_now_iso();

    it->second = next;
    save(items);
    if (on_saved) on_saved(next);
    log_debug("mutated " + id + " " + to_string(from) + " -> " + to_string(next.status));
    return next;
}

void CanonicalStore::insert(const WorkItem& item) const {
    auto guard = lock();
    WorkItemMap items = load();
    if (!items.emplace(item.id, item).second) throw DuplicateIDError(item.id);
    save(items);
}

bool CanonicalStore::transact(const std::function<bool(WorkItemMap&)>& fn) const {
    auto guard = lock();
    WorkItemMap items = load();
    if (!fn(items)) return false;
    save(items);
    return true;
}

} // namespace coord
