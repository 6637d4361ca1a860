#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "coord/config.h"
#include "coord/work_item.h"

namespace coord {

struct CompletionRecord {
    std::string work_item_id;
    std::string agent_id;
    std::string completed_at;
    std::string result;
    double velocity_points{0.0};
};

// coordination_log.json: JSON array of completion records, kept for audit
// and velocity reporting. Appends rewrite the file atomically.
class CoordinationLog {
public:
    explicit CoordinationLog(const Config& cfg);

    // Caller holds the store lock.
    void append(const CompletionRecord& rec) const;

    // Missing file => empty. Throws CorruptStoreError if unparsable.
    std::vector<CompletionRecord> load() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

CompletionRecord completion_record_for(const WorkItem& w);

} // namespace coord
