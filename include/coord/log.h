#pragma once
#include <optional>
#include <string>

namespace coord {

enum class LogLevel { Error = 0, Warn, Info, Debug };

void set_log_level(LogLevel lvl);
LogLevel log_level();
std::optional<LogLevel> parse_log_level(const std::string& s);

// "[coord] WARN <msg>" on stderr. stdout is left to command output.
void log_line(LogLevel lvl, const std::string& msg);

inline void log_error(const std::string& msg) { log_line(LogLevel::Error, msg); }
inline void log_warn(const std::string& msg) { log_line(LogLevel::Warn, msg); }
inline void log_info(const std::string& msg) { log_line(LogLevel::Info, msg); }
inline void log_debug(const std::string& msg) { log_line(LogLevel::Debug, msg); }

} // namespace coord
