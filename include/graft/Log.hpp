/**
 * @file Log.hpp
 * @brief Leveled diagnostics on stderr
 *
 * Messages at or above the current threshold are written to the log
 * stream (stderr by default) as "[LEVEL] message".
 */

#ifndef GRAFT_LOG_HPP
#define GRAFT_LOG_HPP

#include <ostream>
#include <string>

namespace graft {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Parse a level name ("error", "warn", "info", "debug"; case-insensitive)
 * @throws std::invalid_argument for unknown names
 */
LogLevel parse_log_level(const std::string& name);

std::string to_string(LogLevel level);

void set_log_level(LogLevel level);
LogLevel log_level();

/// Redirects log output; pass nullptr to restore stderr.
void set_log_stream(std::ostream* stream);

bool log_enabled(LogLevel level);

void log(LogLevel level, const std::string& message);

inline void log_error(const std::string& message) { log(LogLevel::Error, message); }
inline void log_warn(const std::string& message) { log(LogLevel::Warn, message); }
inline void log_info(const std::string& message) { log(LogLevel::Info, message); }
inline void log_debug(const std::string& message) { log(LogLevel::Debug, message); }

} // namespace graft

#endif // GRAFT_LOG_HPP
