// src/query_view.cpp
#include "coord/query_view.h"
#include "coord/archive.h"

namespace coord {

bool matches(const QueryFilter& f, const WorkItem& w) {
    if (f.team && w.team != *f.team) return false;
    if (f.type && w.type != *f.type) return false;
    if (f.agent_id && w.agent_id != *f.agent_id) return false;
    if (f.status && w.status != *f.status) return false;
    if (f.priority && w.priority != *f.priority) return false;
    return true;
}

QueryView::QueryView(const Config& cfg,
                     const CanonicalStore& store,
                     const FastAppendLog& log,
                     const Reconciler& reconciler,
                     const CoordinationLog& clog)
    : archive_dir_(cfg.archive_dir()), store_(store), log_(log), reconciler_(reconciler), clog_(clog) {}

WorkItemMap QueryView::gather(bool with_archive, size_t* pending) const {
    // checkpoint first: anything merged after this read is in the store too
    const uint64_t cp = reconciler_.load_checkpoint();
    WorkItemMap items = store_.load();

    size_t n_pending = 0;
    FastLogCursor cur = log_.read_since(cp);
    FastLogEntry e;
    while (cur.next(e)) {
        if (items.count(e.item.id)) continue;
        WorkItem w = std::move(e.item);
        w.status = Status::Active;
        items.emplace(w.id, std::move(w));
        ++n_pending;
    }
    if (pending) *pending = n_pending;

    if (with_archive) {
        for (auto& w : load_archived_items(archive_dir_)) {
            items.emplace(w.id, std::move(w));
        }
    }
    return items;
}

std::vector<WorkItem> QueryView::snapshot(const QueryFilter& filter) const {
    const bool with_archive = filter.include_archived ||
                              (filter.status && *filter.status == Status::Archived);
    WorkItemMap items = gather(with_archive, nullptr);

    std::vector<WorkItem> out;
    for (auto& kv : items) {
        if (matches(filter, kv.second)) out.push_back(std::move(kv.second));
    }
    return out;
}

DashboardSummary QueryView::summary() const {
    DashboardSummary s;
    for (Status st : {Status::Active, Status::InProgress, Status::Completed, Status::Archived}) {
        s.by_status[to_string(st)] = 0;
    }

    const WorkItemMap items = gather(true, &s.pending_fast_claims);
    for (const auto& kv : items) {
        const WorkItem& w = kv.second;
        ++s.total;
        ++s.by_status[to_string(w.status)];

        const std::string team = w.team.empty() ? "unknown" : w.team;
        TeamStats& ts = s.by_team[team];
        ++ts.total;
        if (w.status == Status::Completed || w.status == Status::Archived) {
            ++ts.completed;
            ts.velocity += w.velocity;
        }
        if (w.status == Status::Active || w.status == Status::InProgress) {
            ++s.by_priority[to_string(w.priority)];
        }
    }

    const auto completions = clog_.load();
    s.completions_logged = completions.size();
    for (const auto& c : completions) s.total_velocity += c.velocity_points;
    if (!completions.empty()) s.average_velocity = s.total_velocity / (double)completions.size();
    return s;
}

} // namespace coord
