// service/main.cpp
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "coord_service.h"
#include "coord/errors.h"
#include "coord/log.h"

using json = nlohmann::json;
using namespace coord;

static const char* kUsage =
  "Usage: coord [--dir DIR] [--config FILE] <command> [args]\n"
  "  claim <type> <description> [--priority low|medium|high|critical] [--team T] [--slow]\n"
  "  progress [<id>] <percent> [--status in_progress|completed]\n"
  "  complete [<id>] [--result R] [--velocity V]\n"
  "  list [--team T] [--status S] [--priority P] [--type T] [--agent A] [--archived]\n"
  "  dashboard\n"
  "  optimize [--older-than-seconds N]\n"
  "  reconcile\n"
  "  gen-id\n"
  "<id> defaults to $CURRENT_WORK_ITEM.\n";

struct Args {
  std::vector<std::string> positional;
  std::vector<std::pair<std::string, std::string>> options;
  std::vector<std::string> flags;

  std::optional<std::string> opt(const std::string& name) const {
    for (auto it = options.rbegin(); it != options.rend(); ++it) {
      if (it->first == name) return it->second;
    }
    return std::nullopt;
  }

  bool flag(const std::string& name) const {
    for (const auto& f : flags) if (f == name) return true;
    return false;
  }
};

static bool is_flag(const std::string& a) {
  return a == "--slow" || a == "--fast" || a == "--archived";
}

static Args parse_args(int argc, char** argv, int start) {
  Args a;
  for (int i = start; i < argc; ++i) {
    std::string s = argv[i];
    if (s.rfind("--", 0) == 0) {
      if (is_flag(s)) { a.flags.push_back(s); continue; }
      if (i + 1 >= argc) throw InvalidArgumentError("missing value for " + s);
      a.options.emplace_back(s, argv[++i]);
    } else {
      a.positional.push_back(std::move(s));
    }
  }
  return a;
}

static long parse_long(const std::string& what, const std::string& v) {
  try {
    size_t pos = 0;
    const long n = std::stol(v, &pos);
    if (pos != v.size()) throw std::invalid_argument(v);
    return n;
  } catch (const std::exception&) {
    throw InvalidArgumentError("invalid " + what + ": " + v);
  }
}

static double parse_double(const std::string& what, const std::string& v) {
  try {
    size_t pos = 0;
    const double d = std::stod(v, &pos);
    if (pos != v.size()) throw std::invalid_argument(v);
    return d;
  } catch (const std::exception&) {
    throw InvalidArgumentError("invalid " + what + ": " + v);
  }
}

static Priority priority_arg(const std::string& v) {
  auto p = parse_priority(v);
  if (!p) throw InvalidArgumentError("invalid priority: " + v);
  return *p;
}

static Status status_arg(const std::string& v) {
  auto s = parse_status(v);
  if (!s) throw InvalidArgumentError("invalid status: " + v);
  return *s;
}

static std::string current_work_item() {
  const char* v = std::getenv("CURRENT_WORK_ITEM");
  if (!v || !*v) throw InvalidArgumentError("no work item id given and CURRENT_WORK_ITEM is not set");
  return v;
}

static json summary_to_json(const DashboardSummary& s) {
  json teams = json::object();
  for (const auto& kv : s.by_team) {
    teams[kv.first] = {
      {"total", kv.second.total},
      {"completed", kv.second.completed},
      {"velocity", kv.second.velocity},
    };
  }
  return {
    {"total", s.total},
    {"by_status", s.by_status},
    {"by_team", teams},
    {"by_priority", s.by_priority},
    {"pending_fast_claims", s.pending_fast_claims},
    {"completions_logged", s.completions_logged},
    {"total_velocity", s.total_velocity},
    {"average_velocity", s.average_velocity},
  };
}

static json items_to_json(const std::vector<WorkItem>& items) {
  json arr = json::array();
  for (const auto& w : items) arr.push_back(to_json(w));
  return arr;
}

static void reply(const json& j) {
  std::cout << j.dump(2) << "\n";
}

static int run(const std::string& cmd, const Args& a, CoordService& svc) {
  if (cmd == "claim") {
    if (a.positional.size() < 2) throw InvalidArgumentError("claim needs <type> <description>");
    const Priority pr = priority_arg(a.opt("--priority").value_or("medium"));
    const std::string team = a.opt("--team").value_or("autonomous_team");
    const bool fast = !a.flag("--slow");
    WorkItem w = svc.claim(a.positional[0], a.positional[1], pr, team, fast);
    reply({{"ok", true}, {"fast_path", fast}, {"item", to_json(w)}});
    return 0;
  }

  if (cmd == "progress") {
    std::string id;
    std::string pct;
    if (a.positional.size() >= 2) {
      id = a.positional[0];
      pct = a.positional[1];
    } else if (a.positional.size() == 1) {
      id = current_work_item();
      pct = a.positional[0];
    } else {
      throw InvalidArgumentError("progress needs [<id>] <percent>");
    }
    std::optional<Status> st;
    if (auto s = a.opt("--status")) st = status_arg(*s);
    WorkItem w = svc.update_progress(id, parse_percent_arg(pct), st);
    reply({{"ok", true}, {"item", to_json(w)}});
    return 0;
  }

  if (cmd == "complete") {
    const std::string id = a.positional.empty() ? current_work_item() : a.positional[0];
    const std::string result = a.opt("--result").value_or("success");
    const double velocity = parse_double("velocity", a.opt("--velocity").value_or("5"));
    WorkItem w = svc.complete(id, result, velocity);
    reply({{"ok", true}, {"item", to_json(w)}});
    return 0;
  }

  if (cmd == "list") {
    QueryFilter f;
    f.team = a.opt("--team");
    f.type = a.opt("--type");
    f.agent_id = a.opt("--agent");
    if (auto s = a.opt("--status")) f.status = status_arg(*s);
    if (auto p = a.opt("--priority")) f.priority = priority_arg(*p);
    f.include_archived = a.flag("--archived");
    const auto items = svc.list(f);
    reply({{"ok", true}, {"count", items.size()}, {"items", items_to_json(items)}});
    return 0;
  }

  if (cmd == "dashboard") {
    reply({{"ok", true}, {"summary", summary_to_json(svc.summary())}});
    return 0;
  }

  if (cmd == "optimize") {
    const long secs = parse_long("older-than-seconds", a.opt("--older-than-seconds").value_or("0"));
    if (secs < 0) throw InvalidArgumentError("older-than-seconds must be >= 0");
    const auto cutoff = std::chrono::system_clock::now() - std::chrono::seconds(secs);
    const OptimizeStats st = svc.optimize_with_stats(cutoff);
    reply({
      {"ok", true},
      {"archived", st.archived},
      {"recovered", st.recovered},
      {"reconciled", st.reconciled},
      {"segments", st.segments},
    });
    return 0;
  }

  if (cmd == "reconcile") {
    reply({{"ok", true}, {"reconciled", svc.reconcile()}});
    return 0;
  }

  if (cmd == "gen-id") {
    reply({{"ok", true}, {"id", svc.next_id()}});
    return 0;
  }

  throw InvalidArgumentError("unknown command: " + cmd);
}

int main(int argc, char** argv) {
  std::string dir;
  std::string config_file;

  int i = 1;
  for (; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--dir" && i + 1 < argc) dir = argv[++i];
    else if (a == "--config" && i + 1 < argc) config_file = argv[++i];
    else if (a == "-h" || a == "--help") { std::cerr << kUsage; return 0; }
    else break;
  }
  if (i >= argc) {
    std::cerr << kUsage;
    return 1;
  }
  const std::string cmd = argv[i];

  try {
    Config cfg = load_config(config_file, dir);
    const Args args = parse_args(argc, argv, i + 1);

    CoordService svc(std::move(cfg));
    return run(cmd, args, svc);
  } catch (const CoordException& e) {
    log_error(std::string(error_code_name(e.code())) + ": " + e.what());
    reply({
      {"ok", false},
      {"error", error_code_name(e.code())},
      {"code", exit_code_for(e.code())},
      {"message", e.what()},
    });
    if (e.code() == ErrorCode::InvalidArgs) std::cerr << kUsage;
    return exit_code_for(e.code());
  } catch (const std::exception& e) {
    log_error(e.what());
    reply({{"ok", false}, {"error", "internal"}, {"code", 2}, {"message", e.what()}});
    return 2;
  }
}
