// src/work_item.cpp
#include "coord/work_item.h"
#include "coord/errors.h"

using json = nlohmann::json;

namespace coord {

const char* to_string(Priority p) {
    switch (p) {
        case Priority::Low:      return "low";
        case Priority::Medium:   return "medium";
        case Priority::High:     return "high";
        case Priority::Critical: return "critical";
    }
    return "medium";
}

const char* to_string(Status s) {
    switch (s) {
        case Status::Active:     return "active";
        case Status::InProgress: return "in_progress";
        case Status::Completed:  return "completed";
        case Status::Archived:   return "archived";
    }
    return "active";
}

std::optional<Priority> parse_priority(const std::string& s) {
    if (s == "low") return Priority::Low;
    if (s == "medium") return Priority::Medium;
    if (s == "high") return Priority::High;
    if (s == "critical") return Priority::Critical;
    return std::nullopt;
}

std::optional<Status> parse_status(const std::string& s) {
    if (s == "active") return Status::Active;
    if (s == "in_progress") return Status::InProgress;
    if (s == "completed") return Status::Completed;
    if (s == "archived") return Status::Archived;
    return std::nullopt;
}

bool operator==(const WorkItem& a, const WorkItem& b) {
    return a.id == b.id && a.type == b.type && a.description == b.description &&
           a.priority == b.priority && a.team == b.team && a.agent_id == b.agent_id &&
           a.status == b.status && a.progress == b.progress && a.velocity == b.velocity &&
           a.result == b.result && a.created_at == b.created_at &&
           a.updated_at == b.updated_at && a.completed_at == b.completed_at &&
           a.schema_version == b.schema_version;
}

bool operator!=(const WorkItem& a, const WorkItem& b) {
    return !(a == b);
}

json to_json(const WorkItem& w) {
    json j;
    j["schema_version"] = w.schema_version;
    j["id"] = w.id;
    j["type"] = w.type;
    j["description"] = w.description;
    j["priority"] = to_string(w.priority);
    j["team"] = w.team;
    j["agent_id"] = w.agent_id;
    j["status"] = to_string(w.status);
    j["progress"] = w.progress;
    j["velocity"] = w.velocity;
    j["result"] = w.result;
    j["created_at"] = w.created_at;
    j["updated_at"] = w.updated_at;
    j["completed_at"] = w.completed_at;
    return j;
}

static WorkItem from_json_v1(const json& j) {
    WorkItem w;
    w.id = j.value("id", "");
    w.type = j.value("type", "");
    w.description = j.value("description", "");
    w.team = j.value("team", "");
    w.agent_id = j.value("agent_id", "");
    w.progress = j.value("progress", 0);
    w.velocity = j.value("velocity", 0.0);
    w.result = j.value("result", "");
    w.created_at = j.value("created_at", "");
    w.updated_at = j.value("updated_at", "");
    w.completed_at = j.value("completed_at", "");

    const std::string pr = j.value("priority", "medium");
    const std::string st = j.value("status", "active");
    auto p = parse_priority(pr);
    auto s = parse_status(st);
    if (!p) throw CorruptStoreError("unknown priority '" + pr + "' for " + w.id);
    if (!s) throw CorruptStoreError("unknown status '" + st + "' for " + w.id);
    w.priority = *p;
    w.status = *s;
    return w;
}

// records written by the original python tooling
static WorkItem from_json_v0(const json& j) {
    WorkItem w;
    w.id = j.value("work_item_id", "");
    w.type = j.value("work_type", "");
    w.description = j.value("description", "");
    w.team = j.value("team", "");
    w.agent_id = j.value("agent_id", "");
    w.progress = j.value("progress", 0);
    w.result = j.value("result", "");
    w.created_at = j.value("claimed_at", "");
    w.updated_at = j.value("last_update", w.created_at);
    w.completed_at = j.value("completed_at", "");
    if (j.contains("velocity_points") && j["velocity_points"].is_number()) {
        w.velocity = j["velocity_points"].get<double>();
    }
    if (!w.completed_at.empty()) w.updated_at = w.completed_at;

    const std::string pr = j.value("priority", "medium");
    const std::string st = j.value("status", "active");
    auto p = parse_priority(pr);
    auto s = parse_status(st);
    if (!p) throw CorruptStoreError("unknown priority '" + pr + "' for " + w.id);
    if (!s) throw CorruptStoreError("unknown status '" + st + "' for " + w.id);
    w.priority = *p;
    w.status = *s;
    return w;
}

WorkItem work_item_from_json(const json& j) {
    if (!j.is_object()) throw CorruptStoreError("work item record is not an object");

    WorkItem w;
    try {
        const int version = j.value("schema_version", j.contains("id") ? kWorkItemSchemaVersion : 0);
        if (version > kWorkItemSchemaVersion) {
            throw CorruptStoreError("unsupported schema_version " + std::to_string(version));
        }
        w = version == 0 ? from_json_v0(j) : from_json_v1(j);
    } catch (const json::exception& e) {
        throw CorruptStoreError(std::string("malformed work item: ") + e.what());
    }

    if (w.id.empty()) throw CorruptStoreError("work item without id");
    if (w.progress < 0 || w.progress > 100) {
        throw CorruptStoreError("progress out of range for " + w.id);
    }
    w.schema_version = kWorkItemSchemaVersion;
    return w;
}

std::string encode_line(const WorkItem& w) {
    // dump() without indent never emits a raw newline
    return to_json(w).dump();
}

bool is_legal_transition(Status from, Status to) {
    switch (from) {
        case Status::Active:
            return to == Status::InProgress || to == Status::Completed;
        case Status::InProgress:
            return to == Status::InProgress || to == Status::Completed;
        case Status::Completed:
            return to == Status::Archived;
        case Status::Archived:
            return false;
    }
    return false;
}

} // namespace coord
