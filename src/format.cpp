// src/format.cpp
#include "coord/format.h"
#include "coord/errors.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace coord {

static std::string errno_text() {
    return std::strerror(errno);
}

std::string format_utc_iso(TimePoint tp) {
    using namespace std::chrono;
    const auto us = duration_cast<microseconds>(tp.time_since_epoch()).count();
    std::time_t t = (std::time_t)(us / 1000000);
    long frac = (long)(us % 1000000);
    if (frac < 0) {
        frac += 1000000;
        t -= 1;
    }
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << frac << 'Z';
    return oss.str();
}

std::string utc_now_iso() {
    return format_utc_iso(std::chrono::system_clock::now());
}

std::optional<TimePoint> parse_utc_iso(const std::string& s) {
    int Y = 0, M = 0, D = 0, h = 0, m = 0, sec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &Y, &M, &D, &h, &m, &sec, &consumed) != 6) {
        return std::nullopt;
    }
    if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || sec > 60) return std::nullopt;

    size_t i = (size_t)consumed;
    long long micros = 0;
    if (i < s.size() && s[i] == '.') {
        ++i;
        int digits = 0;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (s[i] - '0');
                ++digits;
            }
            ++i;
        }
        while (digits < 6) {
            micros *= 10;
            ++digits;
        }
    }

    long offset_sec = 0;
    if (i < s.size()) {
        const char c = s[i];
        if (c == 'Z' || c == 'z') {
            ++i;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(s.c_str() + i + 1, "%2d:%2d", &oh, &om) != 2) return std::nullopt;
            offset_sec = (long)oh * 3600 + (long)om * 60;
            if (c == '-') offset_sec = -offset_sec;
            i += 6;
        } else {
            return std::nullopt;
        }
    }
    // python's isoformat() + "Z" on an aware datetime yields "+00:00Z"
    if (i < s.size() && (s[i] == 'Z' || s[i] == 'z')) ++i;
    if (i != s.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = Y - 1900;
    tm.tm_mon = M - 1;
    tm.tm_mday = D;
    tm.tm_hour = h;
    tm.tm_min = m;
    tm.tm_sec = sec;
    const std::time_t t = timegm(&tm);

    using namespace std::chrono;
    return TimePoint(duration_cast<system_clock::duration>(
        seconds((long long)t - offset_sec) + microseconds(micros)));
}

std::string utc_now_compact() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

void ensure_dirs(const fs::path& p) {
    if (p.empty()) return;
    std::error_code ec;
    fs::create_directories(p, ec);
    if (ec) throw IoError("mkdir failed: " + p.string() + " err=" + ec.message());
}

void write_file_durable(const fs::path& tmp, const std::string& content) {
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw IoError("cannot open " + tmp.string() + ": " + errno_text());

    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            const std::string err = errno_text();
            ::close(fd);
            throw IoError("write failed " + tmp.string() + ": " + err);
        }
        p += n;
        left -= (size_t)n;
    }
    if (::fsync(fd) != 0) {
        const std::string err = errno_text();
        ::close(fd);
        throw IoError("fsync failed " + tmp.string() + ": " + err);
    }
    if (::close(fd) != 0) throw IoError("close failed " + tmp.string() + ": " + errno_text());
}

void fsync_dir(const fs::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) throw IoError("cannot open dir " + dir.string() + ": " + errno_text());
    const int rc = ::fsync(fd);
    const int saved = errno;
    ::close(fd);
    // some filesystems refuse fsync on directories
    if (rc != 0 && saved != EINVAL) {
        throw IoError("fsync dir failed " + dir.string() + ": " + std::strerror(saved));
    }
}

void atomic_replace_file(const fs::path& tmp, const fs::path& fin) {
    std::error_code ec;
    fs::rename(tmp, fin, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw IoError("atomic replace failed: tmp=" + tmp.string() + " fin=" + fin.string());
    }
    fsync_dir(fin.has_parent_path() ? fin.parent_path() : fs::path("."));
}

void write_file_atomic(const fs::path& fin, const std::string& content) {
    const fs::path tmp = fin.string() + ".tmp." + std::to_string((long)::getpid());
    try {
        write_file_durable(tmp, content);
    } catch (...) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
    atomic_replace_file(tmp, fin);
}

} // namespace coord
