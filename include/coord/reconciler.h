#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>

#include "coord/canonical_store.h"
#include "coord/config.h"
#include "coord/fast_log.h"

namespace coord {

struct MergeResult {
    size_t inserted{0};
    size_t conflicts{0};      // duplicate ids dropped
    size_t skipped{0};        // malformed lines
    uint64_t from_offset{0};
    uint64_t to_offset{0};
};

// Folds fast-log claims into the canonical store.
//
// The byte offset of the first unmerged line lives in
// work_claims_fast.offset and only moves forward after the store has been
// saved, so a crash in between replays lines that are already merged; those
// are dropped as duplicates.
class Reconciler {
public:
    Reconciler(const Config& cfg, const CanonicalStore& store, const FastAppendLog& log);

    // Takes the store lock. Returns the number of inserted items.
    size_t reconcile() const;

    // Caller holds the store lock. Inserts pending entries into items;
    // persists nothing.
    MergeResult merge_pending(WorkItemMap& items) const;

    // Caller holds the store lock and has saved the store already.
    void commit_checkpoint(uint64_t offset) const;

    // Lock-free read; 0 when missing or unreadable.
    uint64_t load_checkpoint() const;

private:
    std::filesystem::path checkpoint_path_;
    std::filesystem::path archive_dir_;
    const CanonicalStore& store_;
    const FastAppendLog& log_;
};

} // namespace coord
