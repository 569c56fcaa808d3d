// ============================================================================
// log.cpp — implementation for log.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "kamlink/log.hpp"

#include <iostream>   // std::cerr default sink

namespace kamlink {

// Process-wide state; the tool is single-threaded by construction.
static LogLevel      g_level  = LogLevel::Warn;
static std::ostream* g_stream = nullptr;

static const char* level_token(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
    }
    return "info";
}

void set_log_level(LogLevel level) { g_level = level; }

void set_log_stream(std::ostream* os) { g_stream = os; }

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(g_level);
}

void log_line(LogLevel level, const std::string& fields) {
    if (!log_enabled(level)) return;
    std::ostream& os = g_stream ? *g_stream : std::cerr;
    os << "status=" << level_token(level);
    if (!fields.empty()) os << ' ' << fields;
    os << '\n';
}

} // namespace kamlink
