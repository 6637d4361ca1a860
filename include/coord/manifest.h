#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace coord {

struct SegmentStats {
    uint64_t items{0};
};

struct SegmentEntry {
    std::string segment_name;
    std::string path;         // relative to the archive dir
    std::string built_at_utc; // compact
    SegmentStats stats;
};

struct Manifest {
    std::vector<SegmentEntry> segments;
};

// archived_claims/archive_manifest.json. A missing file is an empty manifest;
// an unparsable one throws CorruptStoreError.
Manifest load_manifest(const std::filesystem::path& archive_dir);

// Read-modify-write with atomic replace; caller holds the store lock.
void append_segment_to_manifest(const std::filesystem::path& archive_dir, const SegmentEntry& e);

} // namespace coord
