// src/fast_log.cpp
#include "coord/fast_log.h"
#include "coord/errors.h"
#include "coord/format.h"
#include "coord/log.h"

#include <cerrno>
#include <cstring>
#include <string_view>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace coord {

namespace {

std::string_view get_sv_or_empty(const simdjson::dom::element& doc, const char* key) {
    std::string_view sv{};
    auto err = doc[key].get(sv);
    if (err) return std::string_view{};
    return sv;
}

bool has_key(const simdjson::dom::element& e, const char* key) {
    simdjson::dom::element tmp;
    return !e[key].get(tmp);
}

double get_number_or(const simdjson::dom::element& doc, const char* key, double defv) {
    double d = defv;
    if (doc[key].get(d)) return defv;
    return d;
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\r') return false;
    }
    return true;
}

} // namespace

bool decode_fast_log_line(simdjson::dom::parser& parser,
                          const std::string& line,
                          WorkItem& out,
                          std::string* err) {
    simdjson::dom::element doc;
    if (parser.parse(line).get(doc) || !doc.is_object()) {
        if (err) *err = "not a JSON object";
        return false;
    }

    // pre-versioned lines from the original tool go through the migrating decoder
    if (!has_key(doc, "schema_version") && has_key(doc, "work_item_id")) {
        try {
            out = work_item_from_json(nlohmann::json::parse(line));
            return true;
        } catch (const std::exception& e) {
            if (err) *err = e.what();
            return false;
        }
    }

    int64_t version = kWorkItemSchemaVersion;
    if (has_key(doc, "schema_version") && doc["schema_version"].get(version)) {
        if (err) *err = "schema_version is not an integer";
        return false;
    }
    if (version != kWorkItemSchemaVersion) {
        if (err) *err = "unsupported schema_version " + std::to_string(version);
        return false;
    }

    const std::string_view id = get_sv_or_empty(doc, "id");
    if (id.empty()) {
        if (err) *err = "missing id";
        return false;
    }

    WorkItem w;
    w.id = std::string(id);
    w.type = std::string(get_sv_or_empty(doc, "type"));
    w.description = std::string(get_sv_or_empty(doc, "description"));
    w.team = std::string(get_sv_or_empty(doc, "team"));
    w.agent_id = std::string(get_sv_or_empty(doc, "agent_id"));
    w.result = std::string(get_sv_or_empty(doc, "result"));
    w.created_at = std::string(get_sv_or_empty(doc, "created_at"));
    w.updated_at = std::string(get_sv_or_empty(doc, "updated_at"));
    w.completed_at = std::string(get_sv_or_empty(doc, "completed_at"));
    w.velocity = get_number_or(doc, "velocity", 0.0);

    const double progress = get_number_or(doc, "progress", 0.0);
    if (progress < 0.0 || progress > 100.0) {
        if (err) *err = "progress out of range";
        return false;
    }
    w.progress = (int)progress;

    const std::string_view pr = get_sv_or_empty(doc, "priority");
    const std::string_view st = get_sv_or_empty(doc, "status");
    auto p = parse_priority(pr.empty() ? std::string("medium") : std::string(pr));
    auto s = parse_status(st.empty() ? std::string("active") : std::string(st));
    if (!p || !s) {
        if (err) *err = "unknown priority or status";
        return false;
    }
    w.priority = *p;
    w.status = *s;

    out = std::move(w);
    return true;
}

// -------------------- FastLogCursor --------------------

FastLogCursor::FastLogCursor(const fs::path& file, uint64_t start)
    : file_(file), pos_(start) {
    std::error_code ec;
    const auto sz = fs::file_size(file_, ec);
    end_ = ec ? 0 : (uint64_t)sz;
    if (pos_ >= end_) return;

    in_.open(file_, std::ios::binary);
    if (!in_) throw IoError("cannot open fast log " + file_.string());
    in_.seekg((std::streamoff)pos_, std::ios::beg);
    if (!in_) throw IoError("seek failed in fast log " + file_.string());
}

bool FastLogCursor::next(FastLogEntry& out) {
    while (pos_ < end_) {
        if (!std::getline(in_, line_)) return false;

        const bool had_newline = !in_.eof();
        const uint64_t line_end = pos_ + line_.size() + (had_newline ? 1 : 0);
        // a writer is mid-append, or the line arrived after the cursor opened
        if (!had_newline || line_end > end_) return false;

        const uint64_t line_start = pos_;
        pos_ = line_end;
        if (line_.empty() || is_blank(line_)) continue;

        WorkItem w;
        std::string err;
        if (!decode_fast_log_line(parser_, line_, w, &err)) {
            ++skipped_;
            log_warn("skipping malformed fast-log line at offset " + std::to_string(line_start) +
                     " in " + file_.string() + ": " + err);
            continue;
        }

        out.item = std::move(w);
        out.offset = line_start;
        out.end_offset = line_end;
        return true;
    }
    return false;
}

// -------------------- FastAppendLog --------------------

FastAppendLog::FastAppendLog(const Config& cfg)
    : FastAppendLog(cfg.fast_log_path(), cfg.fast_log_sync) {}

FastAppendLog::FastAppendLog(fs::path file, bool sync)
    : file_(std::move(file)), sync_(sync) {}

void FastAppendLog::append(const WorkItem& w) const {
    const std::string line = encode_line(w) + "\n";
    if (line.size() > kMaxFastLogLine) {
        throw RecordTooLargeError("fast-log record for " + w.id + " is " + std::to_string(line.size()) +
                                  " bytes, limit " + std::to_string(kMaxFastLogLine));
    }

    ensure_dirs(file_.parent_path());
    const int fd = ::open(file_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) throw IoError("cannot open fast log " + file_.string() + ": " + std::strerror(errno));

    ssize_t n;
    do {
        n = ::write(fd, line.data(), line.size());
    } while (n < 0 && errno == EINTR);

    if (n != (ssize_t)line.size()) {
        const std::string err = n < 0 ? std::strerror(errno) : "short write";
        ::close(fd);
        throw IoError("append failed on " + file_.string() + ": " + err);
    }
    if (sync_ && ::fdatasync(fd) != 0) {
        const std::string err = std::strerror(errno);
        ::close(fd);
        throw IoError("fdatasync failed on " + file_.string() + ": " + err);
    }
    if (::close(fd) != 0) throw IoError("close failed on " + file_.string() + ": " + std::strerror(errno));
}

FastLogCursor FastAppendLog::read_since(uint64_t checkpoint) const {
    return FastLogCursor(file_, checkpoint);
}

uint64_t FastAppendLog::size() const {
    std::error_code ec;
    const auto sz = fs::file_size(file_, ec);
    return ec ? 0 : (uint64_t)sz;
}

} // namespace coord
