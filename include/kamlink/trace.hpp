#pragma once
/**
 * @file trace.hpp
 * @brief Optional raw-traffic log (`--debug-file`) for chasing optical-head trouble.
 *
 * Layout, one row per direction change, appended across runs:
 *
 *   === Session Start 2026-10-19 06:15:00 ===
 *   Tx	 80  3f  10  01  00  3c  b2  5f  0d
 *   Rx	 40  3f  10  00  3c  02  02  42  04  d2  88  50  0d
 *   Msg	CRC error
 *
 * Consecutive bytes in the same direction extend the current row, so a reply
 * that trickles in byte by byte still reads as one line. A Trace that failed to
 * open (or was never opened) silently ignores every call.
 */

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace kamlink {

class Trace {
public:
    Trace() = default;
    ~Trace();

    Trace(const Trace&) = delete;
    Trace& operator=(const Trace&) = delete;

    /// Open @p path for append and write the session banner. False if it cannot be opened.
    bool open(const std::string& path);

    bool is_open() const { return out_.is_open(); }

    void tx(const uint8_t* p, std::size_t n) { bytes("Tx", p, n); }
    void rx(const uint8_t* p, std::size_t n) { bytes("Rx", p, n); }
    void tx(const std::vector<uint8_t>& v)   { bytes("Tx", v.data(), v.size()); }
    void rx(const std::vector<uint8_t>& v)   { bytes("Rx", v.data(), v.size()); }

    /// Free-text event row ("Rx Timeout", "CRC error", ...).
    void msg(const std::string& text);

private:
    void bytes(const char* dir, const uint8_t* p, std::size_t n);

    std::ofstream out_;
    std::string   row_;   ///< direction of the row currently open ("" = none)
};

} // namespace kamlink
