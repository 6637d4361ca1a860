#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "coord/config.h"
#include "coord/scoped_lock.h"
#include "coord/work_item.h"

namespace coord {

// Authoritative map of work items in work_claims.json.
//
// Readers may call load() at any time: the file is only ever replaced by
// rename, so they see either the previous or the next complete version.
// Every write happens while holding lock().
class CanonicalStore {
public:
    explicit CanonicalStore(const Config& cfg);

    // Missing file => empty map. Throws CorruptStoreError if the file exists
    // but does not parse completely.
    WorkItemMap load() const;

    // Caller must hold lock().
    void save(const WorkItemMap& items) const;

    ScopedLock lock() const;

    bool contains(const std::string& id) const;

    using MutateFn = std::function<void(WorkItem&)>;
    using SavedFn = std::function<void(const WorkItem&)>;

    // Locks, loads, checks that id exists (NotFoundError) and that its
    // status is one of expected_from (InvalidTransitionError), applies fn,
    // validates the resulting transition, saves. Nothing is written on failure.
    // on_saved runs after the save, still under the lock.
    WorkItem mutate(const std::string& id,
                    const MutateFn& fn,
                    const std::vector<Status>& expected_from,
                    const SavedFn& on_saved = {}) const;

    // Slow-path claim. Throws DuplicateIDError if id is already present.
    void insert(const WorkItem& item) const;

    // Runs fn on the loaded map under the lock; saves when fn returns true.
    bool transact(const std::function<bool(WorkItemMap&)>& fn) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::filesystem::path lock_path_;
    LockOptions lock_opt_;
};

WorkItemMap parse_store_json(const std::string& text, const std::string& origin);
std::string dump_store_json(const WorkItemMap& items);

} // namespace coord
