#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "coord/canonical_store.h"
#include "coord/errors.h"
#include "coord/format.h"
#include "coord/work_item.h"

using namespace coord;

static std::filesystem::path test_data_file(const char* name) {
#ifndef COORD_TEST_DATA_DIR
    return std::filesystem::path("tests/data") / name; // fallback
#else
    return std::filesystem::path(COORD_TEST_DATA_DIR) / name;
#endif
}

static std::string read_all(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static WorkItem sample() {
    WorkItem w;
    w.id = "work_00000000000000000042_00000001deadbeef";
    w.type = "feature";
    w.description = "Add login \"quoted\"\nsecond line";
    w.priority = Priority::Critical;
    w.team = "auth_team";
    w.agent_id = "agent_7";
    w.status = Status::Completed;
    w.progress = 100;
    w.velocity = 8.5;
    w.result = "success";
    w.created_at = "2026-10-19T10:00:00.000001Z";
    w.updated_at = "2026-10-19T11:00:00.000002Z";
    w.completed_at = "2026-10-19T11:00:00.000002Z";
    return w;
}

static void test_round_trip() {
    const WorkItem w = sample();
    const WorkItem back = work_item_from_json(to_json(w));
    assert(back == w);

    const std::string line = encode_line(w);
    assert(line.find('\n') == std::string::npos);
    assert(work_item_from_json(nlohmann::json::parse(line)) == w);
}

static void test_legacy_store_migrates() {
    const WorkItemMap m = parse_store_json(read_all(test_data_file("legacy_claims.json")), "legacy");
    assert(m.size() == 3);

    const WorkItem& a = m.at("work_1750000000000000001");
    assert(a.type == "feature");
    assert(a.priority == Priority::High);
    assert(a.status == Status::Active);
    assert(a.created_at == "2025-06-15T10:00:00.000001Z");
    assert(a.updated_at == a.created_at);
    assert(a.schema_version == kWorkItemSchemaVersion);

    const WorkItem& b = m.at("work_1750000000000000002");
    assert(b.status == Status::InProgress);
    assert(b.progress == 40);
    assert(b.updated_at == "2025-06-15T11:00:00.000001Z");

    const WorkItem& c = m.at("work_1750000000000000003");
    assert(c.status == Status::Completed);
    assert(c.velocity == 8.0);
    assert(c.updated_at == c.completed_at);
}

static void test_rejects_bad_records() {
    bool threw = false;
    try {
        work_item_from_json(nlohmann::json{{"schema_version", 1}, {"id", "x"}, {"status", "paused"}});
    } catch (const CorruptStoreError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        work_item_from_json(nlohmann::json{{"schema_version", 1}, {"type", "bug"}});
    } catch (const CorruptStoreError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        work_item_from_json(nlohmann::json{{"schema_version", 1}, {"id", "x"}, {"progress", 150}});
    } catch (const CorruptStoreError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        work_item_from_json(nlohmann::json{{"schema_version", 99}, {"id", "x"}});
    } catch (const CorruptStoreError&) {
        threw = true;
    }
    assert(threw);
}

static void test_state_machine_table() {
    const Status all[] = {Status::Active, Status::InProgress, Status::Completed, Status::Archived};
    int legal = 0;
    for (Status from : all) {
        for (Status to : all) {
            if (is_legal_transition(from, to)) ++legal;
        }
    }
    assert(legal == 5);
    assert(is_legal_transition(Status::Active, Status::InProgress));
    assert(is_legal_transition(Status::InProgress, Status::InProgress));
    assert(is_legal_transition(Status::Active, Status::Completed));
    assert(is_legal_transition(Status::InProgress, Status::Completed));
    assert(is_legal_transition(Status::Completed, Status::Archived));
    assert(!is_legal_transition(Status::Completed, Status::Active));
    assert(!is_legal_transition(Status::Active, Status::Active));
    assert(!is_legal_transition(Status::Archived, Status::Completed));
}

static void test_enums_and_timestamps() {
    for (Priority p : {Priority::Low, Priority::Medium, Priority::High, Priority::Critical}) {
        assert(parse_priority(to_string(p)) == p);
    }
    for (Status s : {Status::Active, Status::InProgress, Status::Completed, Status::Archived}) {
        assert(parse_status(to_string(s)) == s);
    }
    assert(!parse_priority("urgent"));
    assert(Priority::Low < Priority::Critical);

    auto t = parse_utc_iso("2026-10-19T12:00:00.5Z");
    assert(t);
    assert(format_utc_iso(*t) == "2026-10-19T12:00:00.500000Z");

    auto py = parse_utc_iso("2026-10-19T12:00:00.500000+00:00Z");
    assert(py && *py == *t);

    auto shifted = parse_utc_iso("2026-10-19T14:00:00.5+02:00");
    assert(shifted && *shifted == *t);

    assert(!parse_utc_iso("yesterday"));
    assert(!parse_utc_iso("2026-10-19T12:00:00Zjunk"));

    const auto now = std::chrono::system_clock::now();
    auto back = parse_utc_iso(format_utc_iso(now));
    assert(back);
    const auto diff = std::chrono::duration_cast<std::chrono::microseconds>(now - *back).count();
    assert(diff >= 0 && diff < 1);
}

static void test_error_exit_codes() {
    struct Row { ErrorCode code; const char* name; int exit; };
    const Row rows[] = {
        {ErrorCode::InvalidArgs, "invalid_args", 1},
        {ErrorCode::NotFound, "not_found", 3},
        {ErrorCode::InvalidTransition, "invalid_transition", 4},
        {ErrorCode::LockTimeout, "lock_timeout", 5},
        {ErrorCode::CorruptStore, "corrupt_store", 6},
        {ErrorCode::DuplicateId, "duplicate_id", 7},
        {ErrorCode::IoError, "io_error", 8},
        {ErrorCode::RecordTooLarge, "record_too_large", 9},
        {ErrorCode::ReconciliationConflict, "reconciliation_conflict", 10},
        {ErrorCode::ClockUnavailable, "clock_unavailable", 11},
    };
    for (const auto& r : rows) {
        assert(exit_code_for(r.code) == r.exit);
        assert(std::string(error_code_name(r.code)) == r.name);
    }
    assert(exit_code_for(ErrorCode::Ok) == 0);

    const CoordException& e = NotFoundError("work_x");
    assert(e.code() == ErrorCode::NotFound);
}

int main() {
    test_error_exit_codes();
    test_round_trip();
    test_legacy_store_migrates();
    test_rejects_bad_records();
    test_state_machine_table();
    test_enums_and_timestamps();
    std::cout << "OK\n";
    return 0;
}
