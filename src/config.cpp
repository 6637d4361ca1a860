// src/config.cpp
#include "coord/config.h"
#include "coord/errors.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace coord {

static const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return nullptr;
    return v;
}

static long parse_ms(const std::string& key, const std::string& v) {
    try {
        size_t pos = 0;
        const long n = std::stol(v, &pos);
        if (pos != v.size() || n < 0) throw std::invalid_argument(v);
        return n;
    } catch (const std::exception&) {
        throw InvalidArgumentError("invalid " + key + ": " + v);
    }
}

LockMode parse_lock_mode(const std::string& s) {
    if (s == "advisory" || s == "flock") return LockMode::Advisory;
    if (s == "lockfile") return LockMode::LockFile;
    throw InvalidArgumentError("invalid lock mode: " + s);
}

static LogLevel parse_level_or_throw(const std::string& s) {
    auto lvl = parse_log_level(s);
    if (!lvl) throw InvalidArgumentError("invalid log level: " + s);
    return *lvl;
}

void apply_config_json(Config& cfg, const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        throw InvalidArgumentError(std::string("config is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) throw InvalidArgumentError("config root must be an object");

    try {
        if (j.contains("coordination_dir")) cfg.coordination_dir = j["coordination_dir"].get<std::string>();
        if (j.contains("lock_timeout_ms")) cfg.lock_timeout = std::chrono::milliseconds(j["lock_timeout_ms"].get<int64_t>());
        if (j.contains("lock_backoff_initial_ms")) cfg.lock_backoff_initial = std::chrono::milliseconds(j["lock_backoff_initial_ms"].get<int64_t>());
        if (j.contains("lock_backoff_max_ms")) cfg.lock_backoff_max = std::chrono::milliseconds(j["lock_backoff_max_ms"].get<int64_t>());
        if (j.contains("lock_stale_after_ms")) cfg.lock_stale_after = std::chrono::milliseconds(j["lock_stale_after_ms"].get<int64_t>());
        if (j.contains("lock_mode")) cfg.lock_mode = parse_lock_mode(j["lock_mode"].get<std::string>());
        if (j.contains("fast_log_sync")) cfg.fast_log_sync = j["fast_log_sync"].get<bool>();
        if (j.contains("archive_segment_max_items")) cfg.archive_segment_max_items = j["archive_segment_max_items"].get<uint32_t>();
        if (j.contains("agent_id")) cfg.agent_id = j["agent_id"].get<std::string>();
        if (j.contains("log_level")) cfg.log_level = parse_level_or_throw(j["log_level"].get<std::string>());
    } catch (const json::exception& e) {
        throw InvalidArgumentError(std::string("bad config value: ") + e.what());
    }

    if (cfg.archive_segment_max_items == 0) {
        throw InvalidArgumentError("archive_segment_max_items must be > 0");
    }
    if (cfg.lock_backoff_initial.count() <= 0) cfg.lock_backoff_initial = std::chrono::milliseconds(1);
}

static void apply_config_file(Config& cfg, const fs::path& p) {
    std::ifstream in(p);
    if (!in) throw InvalidArgumentError("cannot open config file: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    apply_config_json(cfg, ss.str());
}

Config load_config(const fs::path& config_file, const fs::path& dir_override) {
    Config cfg;

    if (const char* d = env_or_null("COORDINATION_DIR")) cfg.coordination_dir = d;
    if (!dir_override.empty()) cfg.coordination_dir = dir_override;

    if (!config_file.empty()) {
        apply_config_file(cfg, config_file);
    } else {
        const fs::path implicit = cfg.coordination_dir / "coord_config.json";
        std::error_code ec;
        if (fs::exists(implicit, ec)) apply_config_file(cfg, implicit);
    }

    // environment wins over the file
    if (const char* d = env_or_null("COORDINATION_DIR")) cfg.coordination_dir = d;
    if (const char* a = env_or_null("AGENT_ID")) cfg.agent_id = a;
    if (const char* t = env_or_null("COORD_LOCK_TIMEOUT_MS")) {
        cfg.lock_timeout = std::chrono::milliseconds(parse_ms("COORD_LOCK_TIMEOUT_MS", t));
    }
    if (const char* m = env_or_null("COORD_LOCK_MODE")) cfg.lock_mode = parse_lock_mode(m);
    if (const char* l = env_or_null("COORD_LOG_LEVEL")) cfg.log_level = parse_level_or_throw(l);
    if (!dir_override.empty()) cfg.coordination_dir = dir_override;

    return cfg;
}

} // namespace coord
