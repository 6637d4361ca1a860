#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "coord/archive.h"
#include "coord/canonical_store.h"
#include "coord/config.h"
#include "coord/coordination_log.h"
#include "coord/fast_log.h"
#include "coord/format.h"
#include "coord/id_generator.h"
#include "coord/query_view.h"
#include "coord/reconciler.h"
#include "coord/work_item.h"

// One per process. Everything it touches lives under cfg.coordination_dir;
// concurrency with other processes goes through the store lock only.
// Parses a CLI percent argument; rejects anything outside 0..100 before narrowing.
int parse_percent_arg(const std::string& v);

class CoordService {
public:
  explicit CoordService(coord::Config cfg);

  CoordService(const CoordService&) = delete;
  CoordService& operator=(const CoordService&) = delete;

  // fast=true appends to the fast log and never waits for the lock.
  coord::WorkItem claim(const std::string& type,
                        const std::string& description,
                        coord::Priority priority,
                        const std::string& team,
                        bool fast);

  // status: InProgress (default) or Completed.
  coord::WorkItem update_progress(const std::string& id,
                                  int percent,
                                  std::optional<coord::Status> status = std::nullopt);

  coord::WorkItem complete(const std::string& id, const std::string& result, double velocity);

  std::vector<coord::WorkItem> list(const coord::QueryFilter& filter) const;
  coord::DashboardSummary summary() const;

  size_t optimize(coord::TimePoint older_than);
  coord::OptimizeStats optimize_with_stats(coord::TimePoint older_than);

  size_t reconcile();

  std::string next_id() { return ids_.generate(); }

  const coord::Config& config() const { return cfg_; }
  const std::string& agent_id() const { return cfg_.agent_id; }

private:
  // progress/complete on an id still only in the fast log merge it first
  void ensure_reconciled(const std::string& id);
  void throw_if_archived(const std::string& id) const;
  coord::WorkItem mutate_open(const std::string& id,
                              const coord::CanonicalStore::MutateFn& fn,
                              const coord::CanonicalStore::SavedFn& on_saved);

  coord::Config cfg_;
  coord::IdGenerator ids_;
  coord::CanonicalStore store_;
  coord::FastAppendLog log_;
  coord::CoordinationLog clog_;
  coord::Reconciler reconciler_;
  coord::ArchiveCompactor compactor_;
  coord::QueryView view_;
};
