#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include <simdjson.h>

#include "coord/config.h"
#include "coord/work_item.h"

namespace coord {

// Lines up to this size are written by one write(2) on an O_APPEND
// descriptor and do not interleave with other writers.
constexpr size_t kMaxFastLogLine = 4096;

struct FastLogEntry {
    WorkItem item;
    uint64_t offset{0};     // first byte of the line
    uint64_t end_offset{0}; // one past its newline
};

// Forward-only reader over complete lines in [start, end). end is the file
// size when the cursor was opened, so the sequence is finite even while
// other processes keep appending. Re-open from the same offset to restart.
class FastLogCursor {
public:
    FastLogCursor(const std::filesystem::path& file, uint64_t start);

    // False once no complete line is left before end().
    // Malformed lines are skipped (logged) but still consumed.
    bool next(FastLogEntry& out);

    uint64_t position() const { return pos_; }
    uint64_t end() const { return end_; }
    uint64_t skipped() const { return skipped_; }

private:
    std::filesystem::path file_;
    std::ifstream in_;
    uint64_t pos_{0};
    uint64_t end_{0};
    uint64_t skipped_{0};
    simdjson::dom::parser parser_;
    std::string line_;
};

class FastAppendLog {
public:
    explicit FastAppendLog(const Config& cfg);
    FastAppendLog(std::filesystem::path file, bool sync);

    // Throws RecordTooLargeError (nothing written) if the encoded line
    // exceeds kMaxFastLogLine, IoError on write failure.
    void append(const WorkItem& w) const;

    FastLogCursor read_since(uint64_t checkpoint) const;

    // Current size in bytes, 0 if the log does not exist yet.
    uint64_t size() const;

    const std::filesystem::path& path() const { return file_; }

private:
    std::filesystem::path file_;
    bool sync_{false};
};

// Decodes one log line. Returns false (and sets err) on malformed input.
bool decode_fast_log_line(simdjson::dom::parser& parser,
                          const std::string& line,
                          WorkItem& out,
                          std::string* err);

} // namespace coord
