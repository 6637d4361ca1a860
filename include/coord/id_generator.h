#pragma once
#include <cstdint>
#include <mutex>
#include <string>

namespace coord {

// Work item ids: "work_<20-digit unix ns>_<16 hex salt>".
//
// The salt combines the pid (high 32 bits) with a hash of the host name and a
// random seed (low 32 bits), so two processes reading the same nanosecond
// still produce distinct ids. Within one generator ids never go backwards:
// a clock tick that does not advance past the previous id is bumped by 1ns.
// Nothing is promised about ordering between processes or hosts.
class IdGenerator {
public:
    explicit IdGenerator(std::string prefix = "work");

    IdGenerator(const IdGenerator&) = delete;
    IdGenerator& operator=(const IdGenerator&) = delete;

    // Thread-safe. Throws ClockError if the realtime clock cannot be read.
    std::string generate();

    uint64_t salt() const;

private:
    void reseed_locked(int pid);

    std::string prefix_;
    mutable std::mutex mu_;
    uint64_t last_ns_{0};
    uint64_t salt_{0};
    int pid_{0};
};

uint64_t realtime_ns();

std::string generate_agent_id();

} // namespace coord
