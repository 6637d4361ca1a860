#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include <unistd.h>

#include "coord/archive.h"
#include "coord/canonical_store.h"
#include "coord/coordination_log.h"
#include "coord/fast_log.h"
#include "coord/format.h"
#include "coord/query_view.h"
#include "coord/reconciler.h"

using namespace coord;
namespace fs = std::filesystem;

static fs::path mk_tmp_dir(const char* tag) {
    auto p = fs::temp_directory_path() / ("coord_test_" + std::string(tag) + "_" + std::to_string((long)::getpid()));
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

static WorkItem item(const std::string& id, const std::string& team, Status st, Priority pr = Priority::Medium) {
    WorkItem w;
    w.id = id;
    w.type = team == "ui_team" ? "ui" : "backend";
    w.description = "view " + id;
    w.team = team;
    w.agent_id = "agent_" + team;
    w.priority = pr;
    w.status = st;
    w.created_at = utc_now_iso();
    w.updated_at = w.created_at;
    if (st == Status::Completed) {
        w.progress = 100;
        w.completed_at = w.updated_at;
        w.velocity = 5.0;
    }
    return w;
}

struct Fixture {
    Config cfg;
    CanonicalStore store;
    FastAppendLog log;
    Reconciler rec;
    CoordinationLog clog;
    ArchiveCompactor compactor;
    QueryView view;

    explicit Fixture(const fs::path& dir)
        : cfg(make_cfg(dir)),
          store(cfg),
          log(cfg),
          rec(cfg, store, log),
          clog(cfg),
          compactor(cfg, store, rec),
          view(cfg, store, log, rec, clog) {}

    static Config make_cfg(const fs::path& dir) {
        Config c;
        c.coordination_dir = dir;
        c.lock_timeout = std::chrono::milliseconds(200);
        return c;
    }
};

static void test_fast_claims_visible_before_reconcile() {
    Fixture f(mk_tmp_dir("view_fast"));
    f.store.insert(item("work_slow", "core_team", Status::InProgress));
    f.log.append(item("work_fast", "core_team", Status::Active));

    const auto all = f.view.snapshot(QueryFilter{});
    assert(all.size() == 2);
    bool saw_fast = false;
    for (const auto& w : all) {
        if (w.id == "work_fast") {
            saw_fast = true;
            assert(w.status == Status::Active);
        }
    }
    assert(saw_fast);
    // reading is not reconciling
    assert(f.store.load().size() == 1);
    assert(f.view.summary().pending_fast_claims == 1);

    f.rec.reconcile();
    assert(f.view.snapshot(QueryFilter{}).size() == 2);
    assert(f.view.summary().pending_fast_claims == 0);

    // a lost checkpoint must not double-count
    fs::remove(f.cfg.checkpoint_path());
    assert(f.view.snapshot(QueryFilter{}).size() == 2);
    assert(f.view.summary().total == 2);
}

static void test_filters() {
    Fixture f(mk_tmp_dir("view_filter"));
    f.store.insert(item("work_1", "ui_team", Status::Active, Priority::High));
    f.store.insert(item("work_2", "ui_team", Status::Completed));
    f.store.insert(item("work_3", "core_team", Status::InProgress, Priority::Critical));

    QueryFilter by_team;
    by_team.team = "ui_team";
    assert(f.view.snapshot(by_team).size() == 2);

    QueryFilter by_status;
    by_status.status = Status::InProgress;
    const auto ip = f.view.snapshot(by_status);
    assert(ip.size() == 1 && ip[0].id == "work_3");

    QueryFilter combined;
    combined.team = "ui_team";
    combined.priority = Priority::High;
    combined.type = "ui";
    const auto c = f.view.snapshot(combined);
    assert(c.size() == 1 && c[0].id == "work_1");

    QueryFilter by_agent;
    by_agent.agent_id = "agent_core_team";
    assert(f.view.snapshot(by_agent).size() == 1);

    QueryFilter none;
    none.team = "nobody";
    assert(f.view.snapshot(none).empty());
}

static void test_archived_only_on_request() {
    Fixture f(mk_tmp_dir("view_archive"));
    f.store.insert(item("work_done", "core_team", Status::Completed));
    f.store.insert(item("work_open", "core_team", Status::Active));
    assert(f.compactor.optimize(std::chrono::system_clock::now() + std::chrono::hours(1)) == 1);

    assert(f.view.snapshot(QueryFilter{}).size() == 1);

    QueryFilter with;
    with.include_archived = true;
    assert(f.view.snapshot(with).size() == 2);

    QueryFilter archived;
    archived.status = Status::Archived;
    const auto a = f.view.snapshot(archived);
    assert(a.size() == 1 && a[0].id == "work_done");
}

static void test_summary() {
    Fixture f(mk_tmp_dir("view_summary"));
    f.store.insert(item("work_1", "ui_team", Status::Completed));
    f.store.insert(item("work_2", "ui_team", Status::Active, Priority::High));
    f.store.insert(item("work_3", "core_team", Status::InProgress, Priority::High));

    CompletionRecord r;
    r.work_item_id = "work_1";
    r.agent_id = "agent_ui_team";
    r.completed_at = utc_now_iso();
    r.result = "ok";
    r.velocity_points = 5.0;
    f.clog.append(r);
    r.work_item_id = "work_0";
    r.velocity_points = 3.0;
    f.clog.append(r);

    const DashboardSummary s = f.view.summary();
    assert(s.total == 3);
    assert(s.by_status.at("active") == 1);
    assert(s.by_status.at("in_progress") == 1);
    assert(s.by_status.at("completed") == 1);
    assert(s.by_status.at("archived") == 0);
    assert(s.by_team.at("ui_team").total == 2);
    assert(s.by_team.at("ui_team").completed == 1);
    assert(s.by_priority.at("high") == 2);
    assert(s.completions_logged == 2);
    assert(s.total_velocity == 8.0);
    assert(s.average_velocity == 4.0);
}

static void test_reads_while_lock_held() {
    Fixture f(mk_tmp_dir("view_nolock"));
    f.store.insert(item("work_1", "core_team", Status::Active));

    auto guard = f.store.lock();
    const auto t0 = std::chrono::steady_clock::now();
    assert(f.view.snapshot(QueryFilter{}).size() == 1);
    (void)f.view.summary();
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(200));
}

int main() {
    test_fast_claims_visible_before_reconcile();
    test_filters();
    test_archived_only_on_request();
    test_summary();
    test_reads_while_lock_held();
    std::cout << "OK\n";
    return 0;
}
