#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <cerrno>

#include <sys/file.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include "coord/errors.h"
#include "coord/scoped_lock.h"

using namespace coord;
namespace fs = std::filesystem;

// Filesystems without flock support (some NFS setups) answer ENOLCK.
static std::atomic<int> g_flock_errno{0};

extern "C" int flock(int fd, int op) noexcept {
    const int err = g_flock_errno.load();
    if (err != 0) {
        errno = err;
        return -1;
    }
    return (int)::syscall(SYS_flock, fd, op);
}

static fs::path mk_tmp_dir(const char* tag) {
    auto p = fs::temp_directory_path() / ("coord_test_" + std::string(tag) + "_" + std::to_string((long)::getpid()));
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

static std::string host() {
    char buf[256];
    if (::gethostname(buf, sizeof(buf)) != 0) return "localhost";
    buf[sizeof(buf) - 1] = '\0';
    return buf;
}

static LockOptions quick(LockMode mode) {
    LockOptions o;
    o.timeout = std::chrono::milliseconds(150);
    o.backoff_initial = std::chrono::milliseconds(1);
    o.backoff_max = std::chrono::milliseconds(20);
    o.stale_after = std::chrono::milliseconds(60000);
    o.mode = mode;
    return o;
}

static bool times_out(const fs::path& lock, const LockOptions& o) {
    try {
        ScopedLock l(lock, o);
        return false;
    } catch (const LockTimeoutError&) {
        return true;
    }
}

static void test_exclusion(LockMode mode) {
    const auto dir = mk_tmp_dir(mode == LockMode::Advisory ? "lock_flock" : "lock_file");
    const auto lock = dir / "work_claims.json.lock";
    const LockOptions o = quick(mode);

    {
        ScopedLock held(lock, o);
        assert(held.held());

        std::atomic<bool> timed_out{false};
        std::thread other([&]() { timed_out = times_out(lock, o); });
        other.join();
        assert(timed_out);
    }
    // released at scope exit
    assert(!times_out(lock, o));

    // released when the holder unwinds with an exception
    try {
        ScopedLock held(lock, o);
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    assert(!times_out(lock, o));

    if (mode == LockMode::LockFile) assert(!fs::exists(lock));
}

static void test_waiter_gets_lock_after_release() {
    const auto dir = mk_tmp_dir("lock_wait");
    const auto lock = dir / "work_claims.json.lock";
    LockOptions o = quick(LockMode::Advisory);
    o.timeout = std::chrono::milliseconds(3000);

    std::atomic<bool> acquired{false};
    auto holder = std::make_unique<ScopedLock>(lock, o);
    std::thread waiter([&]() {
        ScopedLock l(lock, o);
        acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(!acquired);
    holder.reset();
    waiter.join();
    assert(acquired);
}

static void write_owner(const fs::path& lock, long pid, const std::string& h) {
    std::ofstream out(lock);
    out << "{\"pid\":" << pid << ",\"host\":\"" << h << "\",\"mode\":\"lockfile\"}\n";
}

static void test_reclaims_lock_of_dead_owner() {
    const auto dir = mk_tmp_dir("lock_dead");
    const auto lock = dir / "work_claims.json.lock";

    const pid_t child = ::fork();
    if (child == 0) _exit(0);
    int status = 0;
    ::waitpid(child, &status, 0);

    write_owner(lock, (long)child, host());
    ScopedLock l(lock, quick(LockMode::LockFile));
    assert(l.held());
}

static void test_reclaims_expired_lock() {
    const auto dir = mk_tmp_dir("lock_expired");
    const auto lock = dir / "work_claims.json.lock";

    write_owner(lock, 1, "some-other-host");
    fs::last_write_time(lock, fs::file_time_type::clock::now() - std::chrono::hours(1));

    LockOptions o = quick(LockMode::LockFile);
    o.stale_after = std::chrono::milliseconds(1000);
    ScopedLock l(lock, o);
    assert(l.held());
}

static void test_live_owner_is_respected() {
    const auto dir = mk_tmp_dir("lock_live");
    const auto lock = dir / "work_claims.json.lock";

    write_owner(lock, (long)::getpid(), host());
    assert(times_out(lock, quick(LockMode::LockFile)));
    assert(fs::exists(lock));

    // a heartbeat keeps a long holder from looking stale
    fs::remove(lock);
    LockOptions o = quick(LockMode::LockFile);
    o.stale_after = std::chrono::milliseconds(500);
    ScopedLock l(lock, o);
    fs::last_write_time(lock, fs::file_time_type::clock::now() - std::chrono::hours(1));
    l.heartbeat();
    const auto age = fs::file_time_type::clock::now() - fs::last_write_time(lock);
    assert(age < std::chrono::minutes(1));
}

static void test_falls_back_when_flock_unsupported() {
    const auto dir = mk_tmp_dir("lock_enolck");
    const auto lock = dir / "work_claims.json.lock";
    g_flock_errno = ENOLCK;

    LockOptions o = quick(LockMode::Advisory);
    o.timeout = std::chrono::milliseconds(1000);
    const auto t0 = std::chrono::steady_clock::now();
    {
        ScopedLock l(lock, o);
        assert(l.held());
        assert(l.mode() == LockMode::LockFile);
        assert(fs::exists(lock));
        // still exclusive after the switch
        assert(times_out(lock, quick(LockMode::Advisory)));
    }
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(900));
    assert(!fs::exists(lock));

    {
        ScopedLock again(lock, o);
        assert(again.mode() == LockMode::LockFile);
    }
    g_flock_errno = 0;
}

static void test_lockfile_mode_after_flock_mode() {
    const auto dir = mk_tmp_dir("lock_mixed");
    const auto lock = dir / "work_claims.json.lock";

    { ScopedLock l(lock, quick(LockMode::Advisory)); }
    // flock mode leaves its file behind, owner record included
    assert(fs::exists(lock));
    assert(fs::file_size(lock) > 0);

    {
        ScopedLock l(lock, quick(LockMode::LockFile));
        assert(l.mode() == LockMode::LockFile);
    }

    // a flock that is really held is not reclaimed
    ScopedLock holder(lock, quick(LockMode::Advisory));
    assert(times_out(lock, quick(LockMode::LockFile)));
}

static void test_empty_lock_file() {
    const auto dir = mk_tmp_dir("lock_empty");
    const auto lock = dir / "work_claims.json.lock";

    // fresh: its creator may still be writing the owner record
    { std::ofstream touch(lock); }
    assert(times_out(lock, quick(LockMode::LockFile)));

    fs::last_write_time(lock, fs::file_time_type::clock::now() - std::chrono::seconds(5));
    ScopedLock l(lock, quick(LockMode::LockFile));
    assert(l.held());
}

int main() {
    test_exclusion(LockMode::Advisory);
    test_exclusion(LockMode::LockFile);
    test_waiter_gets_lock_after_release();
    test_reclaims_lock_of_dead_owner();
    test_reclaims_expired_lock();
    test_live_owner_is_respected();
    test_falls_back_when_flock_unsupported();
    test_lockfile_mode_after_flock_mode();
    test_empty_lock_file();
    std::cout << "OK\n";
    return 0;
}
