#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "coord/canonical_store.h"
#include "coord/config.h"
#include "coord/coordination_log.h"
#include "coord/fast_log.h"
#include "coord/reconciler.h"

namespace coord {

struct QueryFilter {
    std::optional<std::string> team;
    std::optional<std::string> type;
    std::optional<std::string> agent_id;
    std::optional<Status> status;
    std::optional<Priority> priority;
    bool include_archived{false}; // implied by status == Archived
};

bool matches(const QueryFilter& f, const WorkItem& w);

struct TeamStats {
    size_t total{0};
    size_t completed{0};
    double velocity{0.0};
};

struct DashboardSummary {
    std::map<std::string, size_t> by_status;   // every status, zero included
    std::map<std::string, TeamStats> by_team;
    std::map<std::string, size_t> by_priority; // open items only
    size_t total{0};
    size_t pending_fast_claims{0};
    size_t completions_logged{0};
    double total_velocity{0.0};
    double average_velocity{0.0};
};

// Lock-free read path for dashboards and reports. Combines the store with
// fast-log claims past the checkpoint (shown as active) and, on request, the
// archive. A claim merged concurrently may be seen via either source; ids
// are deduplicated with the store taking precedence.
class QueryView {
public:
    QueryView(const Config& cfg,
              const CanonicalStore& store,
              const FastAppendLog& log,
              const Reconciler& reconciler,
              const CoordinationLog& clog);

    // Sorted by id.
    std::vector<WorkItem> snapshot(const QueryFilter& filter) const;

    DashboardSummary summary() const;

private:
    WorkItemMap gather(bool with_archive, size_t* pending) const;

    std::filesystem::path archive_dir_;
    const CanonicalStore& store_;
    const FastAppendLog& log_;
    const Reconciler& reconciler_;
    const CoordinationLog& clog_;
};

} // namespace coord
