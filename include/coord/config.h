#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "coord/log.h"

namespace coord {

enum class LockMode {
    Advisory, // flock(2), falls back to LockFile where unsupported
    LockFile, // O_EXCL lock file with owner record and staleness timeout
};

struct Config {
    std::filesystem::path coordination_dir{"agent_coordination"};

    std::chrono::milliseconds lock_timeout{5000};
    std::chrono::milliseconds lock_backoff_initial{2};
    std::chrono::milliseconds lock_backoff_max{200};
    std::chrono::milliseconds lock_stale_after{30000};
    LockMode lock_mode{LockMode::Advisory};

    bool fast_log_sync{false};            // fdatasync after each fast-path append
    uint32_t archive_segment_max_items{1000};

    std::string agent_id;                 // empty => generated per process
    LogLevel log_level{LogLevel::Warn};

    std::filesystem::path claims_path() const { return coordination_dir / "work_claims.json"; }
    std::filesystem::path fast_log_path() const { return coordination_dir / "work_claims_fast.jsonl"; }
    std::filesystem::path checkpoint_path() const { return coordination_dir / "work_claims_fast.offset"; }
    std::filesystem::path lock_path() const { return coordination_dir / "work_claims.json.lock"; }
    std::filesystem::path coordination_log_path() const { return coordination_dir / "coordination_log.json"; }
    std::filesystem::path archive_dir() const { return coordination_dir / "archived_claims"; }
};

// Defaults, then the JSON config file (explicit path, or coord_config.json in
// the coordination directory when present), then environment variables:
// COORDINATION_DIR, AGENT_ID, COORD_LOCK_TIMEOUT_MS, COORD_LOCK_MODE,
// COORD_LOG_LEVEL. A non-empty dir_override (e.g. from --dir) beats all of
// them. Throws InvalidArgumentError on bad values.
Config load_config(const std::filesystem::path& config_file = {},
                   const std::filesystem::path& dir_override = {});

// Overlays one JSON object onto cfg.
void apply_config_json(Config& cfg, const std::string& json_text);

LockMode parse_lock_mode(const std::string& s);

} // namespace coord
