#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace coord {

using TimePoint = std::chrono::system_clock::time_point;

// "2026-10-19T12:00:00.123456Z"
std::string utc_now_iso();
std::string format_utc_iso(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS[.ffffff][Z|+00:00]". Offsets other than UTC
// are applied.
std::optional<TimePoint> parse_utc_iso(const std::string& s);

// "20261019_120000"
std::string utc_now_compact();

// Writes content to tmp and fsyncs it. Throws IoError on failure.
void write_file_durable(const std::filesystem::path& tmp, const std::string& content);

// rename(tmp, fin) followed by an fsync of the parent directory.
// Throws IoError on failure; tmp is removed in that case.
void atomic_replace_file(const std::filesystem::path& tmp,
                         const std::filesystem::path& fin);

// write_file_durable + atomic_replace_file through "<fin>.tmp.<pid>".
void write_file_atomic(const std::filesystem::path& fin, const std::string& content);

void fsync_dir(const std::filesystem::path& dir);

void ensure_dirs(const std::filesystem::path& p);

} // namespace coord
