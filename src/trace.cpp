// ============================================================================
// trace.cpp — implementation for trace.hpp
// ============================================================================

#include "kamlink/trace.hpp"

#include <chrono>    // system_clock for the session banner
#include <ctime>     // std::localtime, std::strftime
#include <cstdio>    // std::snprintf

namespace kamlink {

Trace::~Trace() {
    if (out_.is_open()) {
        if (!row_.empty()) out_ << '\n';
        out_.close();
    }
}

bool Trace::open(const std::string& path) {
    out_.open(path, std::ios::app);
    if (!out_) return false;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char stamp[32] = {0};
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", std::localtime(&now));

    out_ << "\n\n=== Session Start " << stamp << " ===\n";
    out_.flush();
    row_.clear();
    return true;
}

void Trace::bytes(const char* dir, const uint8_t* p, std::size_t n) {
    if (!out_.is_open() || n == 0) return;

    if (row_ != dir) {
        if (!row_.empty()) out_ << '\n';
        out_ << dir << '\t';
        row_ = dir;
    }

    char hex[8];
    for (std::size_t i = 0; i < n; ++i) {
        std::snprintf(hex, sizeof(hex), " %02x ", p[i]);
        out_ << hex;
    }
    out_.flush();
}

void Trace::msg(const std::string& text) {
    if (!out_.is_open()) return;
    if (!row_.empty()) out_ << '\n';
    out_ << "Msg\t" << text << '\n';
    out_.flush();
    row_.clear();
}

} // namespace kamlink
