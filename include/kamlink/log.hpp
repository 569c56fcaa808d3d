#pragma once
/**
 * @page kl-log KamLink Logging
 * @file log.hpp
 * @brief Leveled, single-line `key=value` diagnostics on stderr.
 *
 * @details
 * Every diagnostic is one line that starts with a status token and continues
 * with space-separated `key=value` pairs:
 *
 *   status=error reason=crc_mismatch attempt=2
 *   status=warn reason=unknown_unit code=77 command=60
 *   status=info stage=query ids=60,80
 *   status=debug tx=80 3f 10 01 00 3c b2 5f 0d
 *
 * That keeps the output grep/awk friendly for cron mails and shell wrappers.
 *
 * Levels: Error is always printed. Warn is the default threshold; `--verbose`
 * raises it to Info and `--debug` to Debug.
 *
 * The sink defaults to std::cerr. Tests swap it for a std::ostringstream with
 * set_log_stream() to assert on the emitted lines.
 */

#include <ostream>
#include <string>

namespace kamlink {

enum class LogLevel : int {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3
};

void set_log_level(LogLevel level);

/// Redirect diagnostics; pass nullptr to restore std::cerr.
void set_log_stream(std::ostream* os);

/// True if a message at @p level would be printed (skip building expensive lines otherwise).
bool log_enabled(LogLevel level);

/**
 * @brief Emit one line: "status=<level> <fields>".
 *
 * @param level   Severity; dropped when above the current threshold.
 * @param fields  Pre-formatted `key=value` pairs, e.g. "reason=timeout attempt=1".
 */
void log_line(LogLevel level, const std::string& fields);

inline void log_error(const std::string& fields) { log_line(LogLevel::Error, fields); }
inline void log_warn (const std::string& fields) { log_line(LogLevel::Warn,  fields); }
inline void log_info (const std::string& fields) { log_line(LogLevel::Info,  fields); }
inline void log_debug(const std::string& fields) { log_line(LogLevel::Debug, fields); }

} // namespace kamlink
