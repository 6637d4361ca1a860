#pragma once
#include <chrono>
#include <filesystem>
#include <string>

#include "coord/config.h"

namespace coord {

struct LockOptions {
    std::chrono::milliseconds timeout{5000};
    std::chrono::milliseconds backoff_initial{2};
    std::chrono::milliseconds backoff_max{200};
    std::chrono::milliseconds stale_after{30000};
    LockMode mode{LockMode::Advisory};
};

LockOptions lock_options_from(const Config& cfg);

// Cross-process exclusive lock on one lock file, released on every exit path.
//
// Advisory mode takes flock(LOCK_EX) on the file; the kernel drops it when
// the holder dies, so a killed process never leaves the lock held. When the
// filesystem rejects flock (ENOLCK/EOPNOTSUPP, e.g. some network mounts) or
// LockMode::LockFile is configured, the lock is the existence of the file,
// created with O_EXCL and carrying the owner's pid/host. Such a file is
// reclaimed when its owner pid is gone (same host) or when it has not been
// touched for stale_after.
//
// Acquisition polls with exponential backoff and throws LockTimeoutError
// once timeout has elapsed. Every acquisition uses its own descriptor, so
// threads of one process exclude each other as well.
class ScopedLock {
public:
    ScopedLock(std::filesystem::path lock_file, const LockOptions& opt);
    ~ScopedLock();

    ScopedLock(ScopedLock&& other) noexcept;
    ScopedLock& operator=(ScopedLock&&) = delete;
    ScopedLock(const ScopedLock&) = delete;
    ScopedLock& operator=(const ScopedLock&) = delete;

    // Refreshes the lock file mtime so long holders are not taken for stale.
    void heartbeat();

    LockMode mode() const { return mode_; }
    const std::filesystem::path& path() const { return path_; }
    bool held() const { return fd_ >= 0; }

private:
    enum class Attempt { Acquired, Busy, Unsupported };

    Attempt try_flock();
    Attempt try_lockfile(const LockOptions& opt);
    bool reclaim_if_stale(const LockOptions& opt);
    void write_owner_record();
    void release() noexcept;

    std::filesystem::path path_;
    LockMode mode_{LockMode::Advisory};
    int fd_{-1};
};

} // namespace coord
