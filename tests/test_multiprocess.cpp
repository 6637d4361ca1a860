#include <cassert>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include "coord/errors.h"
#include "coord/id_generator.h"
#include "coord_service.h"

using namespace coord;
namespace fs = std::filesystem;

static fs::path mk_tmp_dir(const char* tag) {
    auto p = fs::temp_directory_path() / ("coord_test_" + std::string(tag) + "_" + std::to_string((long)::getpid()));
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

static Config cfg_for(const fs::path& dir) {
    Config cfg;
    cfg.coordination_dir = dir;
    cfg.lock_timeout = std::chrono::milliseconds(30000);
    return cfg;
}

template <class Fn>
static std::vector<pid_t> spawn(int n, Fn fn) {
    std::vector<pid_t> kids;
    for (int i = 0; i < n; ++i) {
        const pid_t pid = ::fork();
        assert(pid >= 0);
        if (pid == 0) {
            int rc = 0;
            try {
                fn(i);
            } catch (const std::exception& e) {
                std::fprintf(stderr, "child %d: %s\n", i, e.what());
                rc = 1;
            }
            _exit(rc);
        }
        kids.push_back(pid);
    }
    return kids;
}

static void wait_all_ok(const std::vector<pid_t>& kids) {
    for (pid_t pid : kids) {
        int status = 0;
        assert(::waitpid(pid, &status, 0) == pid);
        assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);
    }
}

static std::vector<std::string> read_lines(const fs::path& p) {
    std::vector<std::string> out;
    std::ifstream in(p);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

// a generator inherited across fork() must not repeat ids in the child
static void test_forked_ids_unique() {
    const auto dir = mk_tmp_dir("mp_ids");
    IdGenerator gen;
    const uint64_t parent_salt = gen.salt();
    (void)gen.generate();

    const int kKids = 6;
    const int kPerKid = 2000;
    wait_all_ok(spawn(kKids, [&](int i) {
        std::vector<std::string> mine;
        for (int k = 0; k < kPerKid; ++k) mine.push_back(gen.generate());
        std::ofstream out(dir / ("ids_" + std::to_string(i) + ".txt"));
        out << std::hex << gen.salt() << "\n";
        for (const auto& id : mine) out << id << "\n";
    }));

    std::set<std::string> ids;
    std::set<std::string> salts;
    for (int i = 0; i < kKids; ++i) {
        auto lines = read_lines(dir / ("ids_" + std::to_string(i) + ".txt"));
        assert(lines.size() == (size_t)kPerKid + 1);
        salts.insert(lines[0]);
        for (size_t k = 1; k < lines.size(); ++k) ids.insert(lines[k]);
    }
    assert(ids.size() == (size_t)kKids * kPerKid);
    assert(salts.size() == (size_t)kKids);
    std::ostringstream ps;
    ps << std::hex << parent_salt;
    assert(salts.count(ps.str()) == 0);
}

static void test_concurrent_claims_conserved() {
    const auto dir = mk_tmp_dir("mp_claims");
    const Config cfg = cfg_for(dir);
    const int kKids = 6;
    const int kPerKid = 40;

    wait_all_ok(spawn(kKids, [&](int i) {
        CoordService svc(cfg);
        for (int k = 0; k < kPerKid; ++k) {
            svc.claim("feature", "p" + std::to_string(i) + "_" + std::to_string(k), Priority::Medium,
                      "team_" + std::to_string(i), (k % 2) == 0);
            if (k % 10 == 9) svc.reconcile();
        }
    }));

    CoordService svc(cfg);
    svc.reconcile();
    const auto items = CanonicalStore(cfg).load();
    assert(items.size() == (size_t)kKids * kPerKid);
    assert(svc.reconcile() == 0);
    assert(svc.summary().pending_fast_claims == 0);
}

static void test_concurrent_progress_not_lost() {
    const auto dir = mk_tmp_dir("mp_progress");
    const Config cfg = cfg_for(dir);

    std::vector<std::string> ids;
    {
        CoordService svc(cfg);
        for (int i = 0; i < 6; ++i) ids.push_back(svc.claim("feature", "shared", Priority::Low, "", false).id);
    }

    // each process owns one item but all of them rewrite the same store
    wait_all_ok(spawn((int)ids.size(), [&](int i) {
        CoordService svc(cfg);
        for (int p = 1; p <= 25; ++p) svc.update_progress(ids[i], p * 4 - 1);
        svc.complete(ids[i], "ok", (double)(i + 1));
    }));

    const auto items = CanonicalStore(cfg).load();
    assert(items.size() == ids.size());
    for (const auto& id : ids) {
        assert(items.at(id).status == Status::Completed);
        assert(items.at(id).progress == 100);
    }
    assert(CoordinationLog(cfg).load().size() == ids.size());
}

// a writer killed mid-run never leaves a half-written store behind
static void test_store_survives_sigkill() {
    const auto dir = mk_tmp_dir("mp_kill");
    const Config cfg = cfg_for(dir);
    { CoordService(cfg).claim("feature", "seed", Priority::Low, "", false); }

    for (int round = 0; round < 5; ++round) {
        const pid_t pid = ::fork();
        assert(pid >= 0);
        if (pid == 0) {
            try {
                CoordService svc(cfg);
                for (;;) svc.claim("feature", "churn", Priority::Low, "", false);
            } catch (const std::exception& e) {
                std::fprintf(stderr, "churn: %s\n", e.what());
            }
            _exit(1);
        }
        ::usleep(20000 + round * 7000);
        ::kill(pid, SIGKILL);
        int status = 0;
        ::waitpid(pid, &status, 0);

        const auto items = CanonicalStore(cfg).load();
        assert(!items.empty());
    }

    // the lock is free again once its holder is gone
    CoordService svc(cfg);
    svc.claim("feature", "after", Priority::Low, "", false);
}

int main() {
    test_forked_ids_unique();
    test_concurrent_claims_conserved();
    test_concurrent_progress_not_lost();
    test_store_survives_sigkill();
    std::cout << "OK\n";
    return 0;
}
