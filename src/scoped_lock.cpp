// src/scoped_lock.cpp
#include "coord/scoped_lock.h"
#include "coord/errors.h"
#include "coord/format.h"
#include "coord/id_generator.h"
#include "coord/log.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <random>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace coord {

namespace {

std::string this_host() {
    char buf[256];
    if (::gethostname(buf, sizeof(buf)) != 0) return "localhost";
    buf[sizeof(buf) - 1] = '\0';
    return buf;
}

std::string read_small_file(int fd) {
    std::string out;
    char buf[512];
    while (true) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        out.append(buf, (size_t)n);
        if (out.size() > 4096) break;
    }
    return out;
}

// an empty lock file may belong to a lock-file owner between create and record
constexpr std::chrono::milliseconds kEmptyLockGrace{1000};

// true while another descriptor holds a flock on the same inode
bool flock_is_held(const fs::path& p, const struct stat& expected) {
    const int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;
    struct stat st{};
    if (::fstat(fd, &st) != 0 || st.st_ino != expected.st_ino || st.st_dev != expected.st_dev) {
        ::close(fd);
        return true; // replaced meanwhile: let the next round look again
    }
    bool held = false;
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
        ::flock(fd, LOCK_UN);
    } else {
        held = errno == EWOULDBLOCK || errno == EAGAIN;
    }
    ::close(fd);
    return held;
}

bool pid_is_gone(long pid) {
    if (pid <= 0) return false;
    return ::kill((pid_t)pid, 0) != 0 && errno == ESRCH;
}

} // namespace

LockOptions lock_options_from(const Config& cfg) {
    LockOptions o;
    o.timeout = cfg.lock_timeout;
    o.backoff_initial = cfg.lock_backoff_initial;
    o.backoff_max = cfg.lock_backoff_max;
    o.stale_after = cfg.lock_stale_after;
    o.mode = cfg.lock_mode;
    return o;
}

ScopedLock::ScopedLock(fs::path lock_file, const LockOptions& opt)
    : path_(std::move(lock_file)), mode_(opt.mode) {
    ensure_dirs(path_.parent_path());

    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    auto backoff = std::max(opt.backoff_initial, std::chrono::milliseconds(1));
    std::minstd_rand jitter_rng((unsigned)::getpid() ^ (unsigned)realtime_ns());

    while (true) {
        const Attempt a = mode_ == LockMode::Advisory ? try_flock() : try_lockfile(opt);
        if (a == Attempt::Acquired) return;

        if (a == Attempt::Unsupported) {
            log_warn("flock unsupported on " + path_.string() + ", using lock-file mode");
            mode_ = LockMode::LockFile;
            continue;
        }

        if (mode_ == LockMode::LockFile && reclaim_if_stale(opt)) continue;

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
        if (elapsed >= opt.timeout) {
            throw LockTimeoutError("lock not acquired within " + std::to_string(opt.timeout.count()) +
                                   "ms: " + path_.string());
        }

        const auto remaining = opt.timeout - elapsed;
        const auto jitter = std::chrono::milliseconds(jitter_rng() % (uint32_t)(backoff.count() / 2 + 1));
        std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(backoff + jitter, remaining));
        backoff = std::min(backoff * 2, std::max(opt.backoff_max, opt.backoff_initial));
    }
}

ScopedLock::ScopedLock(ScopedLock&& other) noexcept
    : path_(std::move(other.path_)), mode_(other.mode_), fd_(other.fd_) {
    other.fd_ = -1;
}

ScopedLock::~ScopedLock() {
    release();
}

ScopedLock::Attempt ScopedLock::try_flock() {
    bool created = false;
    int fd = ::open(path_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0 && errno == ENOENT) {
        fd = ::open(path_.c_str(), O_CREAT | O_EXCL | O_RDWR | O_CLOEXEC, 0644);
        if (fd >= 0) created = true;
        else if (errno == EEXIST) return Attempt::Busy; // raced with another creator: retry
    }
    if (fd < 0) throw IoError("cannot open lock file " + path_.string() + ": " + std::strerror(errno));

    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
        fd_ = fd;
        write_owner_record();
        return Attempt::Acquired;
    }

    const int err = errno;
    if (err == ENOLCK || err == EOPNOTSUPP || err == ENOSYS || err == EINVAL) {
        // the lock-file mode needs the path free for O_EXCL
        struct stat mine{}, cur{};
        if (created && ::fstat(fd, &mine) == 0 && mine.st_size == 0 && ::stat(path_.c_str(), &cur) == 0 &&
            mine.st_ino == cur.st_ino && mine.st_dev == cur.st_dev) {
            ::unlink(path_.c_str());
        }
        ::close(fd);
        return Attempt::Unsupported;
    }
    ::close(fd);
    if (err == EWOULDBLOCK || err == EAGAIN || err == EINTR) return Attempt::Busy;
    throw IoError("flock failed on " + path_.string() + ": " + std::strerror(err));
}

ScopedLock::Attempt ScopedLock::try_lockfile(const LockOptions&) {
    const int fd = ::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd >= 0) {
        fd_ = fd;
        write_owner_record();
        return Attempt::Acquired;
    }
    if (errno == EEXIST) return Attempt::Busy;
    throw IoError("cannot create lock file " + path_.string() + ": " + std::strerror(errno));
}

void ScopedLock::write_owner_record() {
    json owner;
    owner["pid"] = (long)::getpid();
    owner["host"] = this_host();
    owner["acquired_at"] = utc_now_iso();
    owner["mode"] = mode_ == LockMode::Advisory ? "flock" : "lockfile";
    const std::string s = owner.dump() + "\n";

    // owner record is informational for flock, authoritative for lock files
    if (::ftruncate(fd_, 0) != 0 || ::pwrite(fd_, s.data(), s.size(), 0) != (ssize_t)s.size()) {
        log_warn("cannot write lock owner record to " + path_.string() + ": " + std::strerror(errno));
    }
}

bool ScopedLock::reclaim_if_stale(const LockOptions& opt) {
    const int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return errno == ENOENT; // released meanwhile: retry now

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        ::close(fd);
        return false;
    }
    const std::string content = read_small_file(fd);
    ::close(fd);

    long owner_pid = 0;
    std::string owner_host;
    std::string owner_mode;
    try {
        const json j = json::parse(content);
        owner_pid = j.value("pid", 0L);
        owner_host = j.value("host", "");
        owner_mode = j.value("mode", "");
    } catch (const json::exception&) {
        // owner is still writing its record; fall back to the age check
    }

    const auto now = std::chrono::system_clock::now();
    const auto mtime = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
    const bool too_old = now - mtime > opt.stale_after;
    const bool dead_owner = owner_host == this_host() && pid_is_gone(owner_pid);

    // files left by flock mode stay on disk after release; they are free
    // unless somebody holds a flock on them right now
    bool abandoned = false;
    const bool flock_file = owner_mode == "flock";
    if (flock_file || st.st_size == 0) {
        if (flock_is_held(path_, st)) return false;
        abandoned = flock_file || now - mtime > kEmptyLockGrace;
    }
    if (!too_old && !dead_owner && !abandoned) return false;

    // move it aside first so two reclaimers cannot both remove a fresh lock
    const fs::path tomb = path_.string() + ".stale." + std::to_string((long)::getpid()) + "." +
                          std::to_string(realtime_ns());
    if (::rename(path_.c_str(), tomb.c_str()) != 0) return errno == ENOENT;

    struct stat moved{};
    if (::stat(tomb.c_str(), &moved) == 0 && (moved.st_ino != st.st_ino || moved.st_dev != st.st_dev)) {
        // someone replaced the stale file with a live lock in between: put it back
        if (::link(tomb.c_str(), path_.c_str()) != 0) {
            log_error("lost a live lock while reclaiming " + path_.string() + ": " + std::strerror(errno));
        }
        ::unlink(tomb.c_str());
        return false;
    }
    ::unlink(tomb.c_str());

    log_warn("reclaimed stale lock " + path_.string() + " (owner pid=" + std::to_string(owner_pid) +
             " host=" + owner_host +
             (dead_owner ? ", owner gone)" : abandoned ? ", no holder)" : ", expired)"));
    return true;
}

void ScopedLock::heartbeat() {
    if (fd_ < 0) return;
    if (::futimens(fd_, nullptr) != 0) {
        log_warn("lock heartbeat failed on " + path_.string() + ": " + std::strerror(errno));
    }
}

void ScopedLock::release() noexcept {
    if (fd_ < 0) return;

    if (mode_ == LockMode::LockFile) {
        // only remove the file if it is still ours (it may have been reclaimed)
        struct stat mine{}, cur{};
        if (::fstat(fd_, &mine) == 0 && ::stat(path_.c_str(), &cur) == 0 &&
            mine.st_ino == cur.st_ino && mine.st_dev == cur.st_dev) {
            ::unlink(path_.c_str());
        }
    } else {
        ::flock(fd_, LOCK_UN);
    }
    ::close(fd_);
    fd_ = -1;
}

} // namespace coord
