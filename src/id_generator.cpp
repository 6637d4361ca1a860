// src/id_generator.cpp
#include "coord/id_generator.h"
#include "coord/errors.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <random>

#include <unistd.h>

namespace coord {

static std::string host_name() {
    char buf[256];
    if (::gethostname(buf, sizeof(buf)) != 0) return "localhost";
    buf[sizeof(buf) - 1] = '\0';
    return buf;
}

uint64_t realtime_ns() {
    timespec ts{};
    if (::clock_gettime(CLOCK_REALTIME, &ts) != 0) {
        throw ClockError(std::string("clock_gettime failed: ") + std::strerror(errno));
    }
    return (uint64_t)ts.tv_sec * 1000000000ull + (uint64_t)ts.tv_nsec;
}

IdGenerator::IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {
    std::lock_guard<std::mutex> lk(mu_);
    reseed_locked((int)::getpid());
}

void IdGenerator::reseed_locked(int pid) {
    std::random_device rd;
    const uint32_t rnd = rd();
    const uint32_t host = (uint32_t)std::hash<std::string>{}(host_name());
    salt_ = ((uint64_t)(uint32_t)pid << 32) | (uint64_t)(host ^ rnd);
    pid_ = pid;
}

std::string IdGenerator::generate() {
    const uint64_t now = realtime_ns();

    uint64_t ns;
    uint64_t salt;
    {
        std::lock_guard<std::mutex> lk(mu_);
        // a forked child inherits the parent's generator; give it its own salt
        const int pid = (int)::getpid();
        if (pid != pid_) reseed_locked(pid);

        ns = now > last_ns_ ? now : last_ns_ + 1;
        last_ns_ = ns;
        salt = salt_;
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "_%020llu_%016llx",
                  (unsigned long long)ns, (unsigned long long)salt);
    return prefix_ + buf;
}

uint64_t IdGenerator::salt() const {
    std::lock_guard<std::mutex> lk(mu_);
    return salt_;
}

std::string generate_agent_id() {
    return "agent_" + std::to_string(realtime_ns());
}

} // namespace coord
