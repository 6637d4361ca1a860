#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace coord {

constexpr int kWorkItemSchemaVersion = 1;

enum class Priority { Low = 0, Medium, High, Critical };

enum class Status { Active = 0, InProgress, Completed, Archived };

const char* to_string(Priority p);
const char* to_string(Status s);

std::optional<Priority> parse_priority(const std::string& s);
std::optional<Status> parse_status(const std::string& s);

struct WorkItem {
    std::string id;
    std::string type;
    std::string description;
    Priority priority{Priority::Medium};
    std::string team;
    std::string agent_id;
    Status status{Status::Active};
    int progress{0};
    double velocity{0.0};
    std::string result;
    std::string created_at;   // UTC ISO-8601
    std::string updated_at;
    std::string completed_at; // empty until completed
    int schema_version{kWorkItemSchemaVersion};
};

bool operator==(const WorkItem& a, const WorkItem& b);
bool operator!=(const WorkItem& a, const WorkItem& b);

// Ordered by id, which sorts by creation time within one process.
using WorkItemMap = std::map<std::string, WorkItem>;

nlohmann::json to_json(const WorkItem& w);

// Throws CorruptStoreError on a missing id or an unknown enum value.
// Schema-version-0 records (work_item_id/work_type/claimed_at/...) are migrated.
WorkItem work_item_from_json(const nlohmann::json& j);

// Single-line encoding used by the fast log (no trailing newline).
std::string encode_line(const WorkItem& w);

// State machine. Claims create Active; everything else goes through here.
bool is_legal_transition(Status from, Status to);

} // namespace coord
