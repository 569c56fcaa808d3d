#pragma once
/**
 * @file byte_stream.hpp
 * @brief Minimal byte-channel interface MeterSession talks through.
 *
 * The session never sees a file descriptor. It writes a whole frame and then
 * pulls bytes until its own predicate says the reply is complete, so the real
 * serial port, a loopback, and the scripted fakes in tests/ are interchangeable.
 */

#include <cstdint>
#include <functional>
#include <vector>

namespace kamlink {

enum class ReadResult : uint8_t { Ok = 0, Timeout = 1, Error = 2 };

/**
 * @brief Bidirectional byte channel owned exclusively by one session.
 *
 * Contract:
 *  - write(bytes) sends everything or returns false.
 *  - read_until(done, timeout_ms, out) appends each received byte to @p out and
 *    calls done(byte); returns Ok as soon as done() is true, Timeout when the
 *    deadline (measured from the call) passes first, Error on an I/O failure.
 *  - discard_input() drops whatever is already buffered (stale replies).
 *  - name() is a short tag for log lines.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;
    virtual bool       write(const std::vector<uint8_t>& bytes) = 0;
    virtual ReadResult read_until(const std::function<bool(uint8_t)>& done,
                                  int timeout_ms,
                                  std::vector<uint8_t>& out) = 0;
    virtual void       discard_input() {}
    virtual const char* name() const = 0;
};

} // namespace kamlink
