#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "coord/canonical_store.h"
#include "coord/config.h"
#include "coord/format.h"
#include "coord/reconciler.h"

namespace coord {

struct OptimizeStats {
    size_t archived{0};        // items written to new segments
    size_t recovered{0};       // already in a segment, only dropped from the store
    size_t reconciled{0};      // fast-log claims merged first
    std::vector<std::string> segments;
};

// Moves completed items out of work_claims.json into immutable segments
// under archived_claims/. Segments are made durable before the store is
// rewritten without their items; an item found both in a segment and in the
// store (crash in between) is dropped from the store, not archived twice.
class ArchiveCompactor {
public:
    ArchiveCompactor(const Config& cfg, const CanonicalStore& store, const Reconciler& reconciler);

    // Archives completed items whose updated_at is before older_than.
    // Returns the number of items moved.
    size_t optimize(TimePoint older_than) const;

    OptimizeStats optimize_with_stats(TimePoint older_than) const;

private:
    std::filesystem::path archive_dir_;
    uint32_t max_items_per_segment_;
    const CanonicalStore& store_;
    const Reconciler& reconciler_;
};

// Segment files in name order (manifest excluded).
std::vector<std::filesystem::path> list_segment_files(const std::filesystem::path& archive_dir);

// Throws CorruptStoreError on an unreadable segment.
std::vector<WorkItem> load_segment(const std::filesystem::path& segment_file);
std::vector<WorkItem> load_archived_items(const std::filesystem::path& archive_dir);
std::unordered_set<std::string> load_archived_ids(const std::filesystem::path& archive_dir);

} // namespace coord
