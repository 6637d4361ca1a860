// service/coord_service.cpp
#include "coord_service.h"

#include "coord/errors.h"
#include "coord/log.h"

#include <stdexcept>

using namespace coord;

namespace {

Config resolved(Config cfg) {
  if (cfg.agent_id.empty()) cfg.agent_id = generate_agent_id();
  return cfg;
}

} // namespace

// -------------------- CoordService --------------------

CoordService::CoordService(Config cfg)
  : cfg_(resolved(std::move(cfg))),
    ids_("work"),
    store_(cfg_),
    log_(cfg_),
    clog_(cfg_),
    reconciler_(cfg_, store_, log_),
    compactor_(cfg_, store_, reconciler_),
    view_(cfg_, store_, log_, reconciler_, clog_) {
  set_log_level(cfg_.log_level);
  ensure_dirs(cfg_.coordination_dir);
}

WorkItem CoordService::claim(const std::string& type,
                             const std::string& description,
                             Priority priority,
                             const std::string& team,
                             bool fast) {
  WorkItem w;
  w.id = ids_.generate();
  w.type = type;
  w.description = description;
  w.priority = priority;
  w.team = team.empty() ? std::string("autonomous_team") : team;
  w.agent_id = cfg_.agent_id;
  w.status = Status::Active;
  w.progress = 0;
  w.created_at = utc_now_iso();
  w.updated_at = w.created_at;

  if (fast) {
    log_.append(w);
  } else {
    store_.insert(w);
  }
  log_debug("agent " + cfg_.agent_id + " claimed " + w.id + (fast ? " (fast path)" : ""));
  return w;
}

int parse_percent_arg(const std::string& v) {
  long n = 0;
  try {
    size_t pos = 0;
    n = std::stol(v, &pos);
    if (pos != v.size()) throw std::invalid_argument(v);
  } catch (const std::exception&) {
    throw InvalidArgumentError("invalid percent: " + v);
  }
  if (n < 0 || n > 100) throw InvalidArgumentError("progress must be within 0..100, got " + v);
  return (int)n;
}

void CoordService::throw_if_archived(const std::string& id) const {
  if (load_archived_ids(cfg_.archive_dir()).count(id)) {
    throw InvalidTransitionError("work item " + id + " is archived");
  }
}

void CoordService::ensure_reconciled(const std::string& id) {
  if (store_.contains(id)) return;
  throw_if_archived(id);
  reconciler_.reconcile();
}

// An optimize may archive the item between the checks and the locked mutate.
WorkItem CoordService::mutate_open(const std::string& id,
                                   const CanonicalStore::MutateFn& fn,
                                   const CanonicalStore::SavedFn& on_saved) {
  ensure_reconciled(id);
  try {
    return store_.mutate(id, fn, {Status::Active, Status::InProgress}, on_saved);
  } catch (const NotFoundError&) {
    throw_if_archived(id);
    throw;
  }
}

WorkItem CoordService::update_progress(const std::string& id, int percent, std::optional<Status> status) {
  if (percent < 0 || percent > 100) {
    throw InvalidArgumentError("progress must be within 0..100, got " + std::to_string(percent));
  }
  const Status target = status.value_or(Status::InProgress);
  if (target != Status::InProgress && target != Status::Completed) {
    throw InvalidTransitionError(std::string("a progress update cannot set status ") + to_string(target));
  }

  if (target == Status::Completed) {
    return mutate_open(
        id,
        [&](WorkItem& w) {
          w.status = Status::Completed;
          w.progress = percent;
          w.completed_at = utc_now_iso();
        },
        [&](const WorkItem& w) { clog_.append(completion_record_for(w)); });
  }

  return mutate_open(
      id,
      [&](WorkItem& w) {
        w.status = Status::InProgress;
        w.progress = percent;
      },
      {});
}

WorkItem CoordService::complete(const std::string& id, const std::string& result, double velocity) {
  return mutate_open(
      id,
      [&](WorkItem& w) {
        w.status = Status::Completed;
        w.progress = 100;
        w.result = result;
        w.velocity = velocity;
        w.completed_at = utc_now_iso();
      },
      [&](const WorkItem& w) { clog_.append(completion_record_for(w)); });
}

std::vector<WorkItem> CoordService::list(const QueryFilter& filter) const {
  return view_.snapshot(filter);
}

DashboardSummary CoordService::summary() const {
  return view_.summary();
}

size_t CoordService::optimize(TimePoint older_than) {
  return compactor_.optimize(older_than);
}

OptimizeStats CoordService::optimize_with_stats(TimePoint older_than) {
  return compactor_.optimize_with_stats(older_than);
}

size_t CoordService::reconcile() {
  return reconciler_.reconcile();
}
