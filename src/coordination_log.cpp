// src/coordination_log.cpp
#include "coord/coordination_log.h"
#include "coord/errors.h"
#include "coord/format.h"

#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace coord {

static json read_log_json(const std::filesystem::path& p) {
    std::ifstream in(p);
    if (!in) return json::array();
    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw CorruptStoreError("cannot parse " + p.string() + ": " + e.what());
    }
    if (!j.is_array()) throw CorruptStoreError(p.string() + ": root is not an array");
    return j;
}

CoordinationLog::CoordinationLog(const Config& cfg) : path_(cfg.coordination_log_path()) {}

void CoordinationLog::append(const CompletionRecord& rec) const {
    json j = read_log_json(path_);
    j.push_back({
        {"work_item_id", rec.work_item_id},
        {"agent_id", rec.agent_id},
        {"completed_at", rec.completed_at},
        {"result", rec.result},
        {"velocity_points", rec.velocity_points},
    });
    ensure_dirs(path_.parent_path());
    write_file_atomic(path_, j.dump(2) + "\n");
}

std::vector<CompletionRecord> CoordinationLog::load() const {
    const json j = read_log_json(path_);
    std::vector<CompletionRecord> out;
    out.reserve(j.size());
    for (const auto& e : j) {
        if (!e.is_object()) continue;
        CompletionRecord r;
        r.work_item_id = e.value("work_item_id", "");
        r.agent_id = e.value("agent_id", "");
        r.completed_at = e.value("completed_at", "");
        r.result = e.value("result", "");
        if (e.contains("velocity_points") && e["velocity_points"].is_number()) {
            r.velocity_points = e["velocity_points"].get<double>();
        }
        out.push_back(std::move(r));
    }
    return out;
}

CompletionRecord completion_record_for(const WorkItem& w) {
    CompletionRecord r;
    r.work_item_id = w.id;
    r.agent_id = w.agent_id.empty() ? "unknown" : w.agent_id;
    r.completed_at = w.completed_at;
    r.result = w.result;
    r.velocity_points = w.velocity;
    return r;
}

} // namespace coord
