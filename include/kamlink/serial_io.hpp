#pragma once
/**
 * @page kl-serial-io KamLink Serial I/O
 * @file serial_io.hpp
 * @brief Linux TTY access for the IR optical head, as a kamlink::ByteStream.
 *
 * @details
 * PURPOSE
 * -------
 * The optical head is a plain USB-serial adapter. This header opens it in raw
 * mode with the meter's line settings and exposes it through the ByteStream
 * contract, so MeterSession can run against the port, a loopback or a test fake
 * without knowing which.
 *
 * LINE SETTINGS
 * -------------
 * KMP on the Multical 402 optical port is 1200 baud, 8 data bits, no parity,
 * 2 stop bits. Other heads and meters in the family use even parity or a single
 * stop bit, and some negotiate 300..9600 baud, so every knob is configurable and
 * passed through untouched.
 *
 * DESIGN CHOICES
 * --------------
 * - RAII: the descriptor closes with the object; copying is disabled.
 * - Non-blocking fd + poll(2): read_until() owns the timeout, one byte at a time.
 *   At 1200 baud a reply is ~100 ms of bytes; throughput is not a concern.
 * - Every byte in and out is mirrored to an optional Trace for field debugging.
 *
 * EXAMPLE
 * -------
 * @code
 *   kamlink::SerialConfig cfg;
 *   cfg.path = "/dev/ttyUSB0";
 *   kamlink::SerialStream port;
 *   kamlink::Error err = kamlink::Error::None;
 *   if (!port.open(cfg, err)) {
 *       std::cerr << "status=error reason=" << kamlink::error_reason(err) << "\n";
 *   }
 * @endcode
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Permissions: the runtime user needs the dialout group (or a udev rule).
 * - The meter switches its IR port off after a few minutes idle and wakes on the
 *   first request; the session's retry budget covers that first lost frame.
 * - Concurrency: one session per port. Nothing here locks the device.
 */

#include "kamlink/byte_stream.hpp"
#include "kamlink/error.hpp"

#include <string>
#include <vector>

namespace kamlink {

class Trace;

enum class Parity : uint8_t { None = 0, Even = 1, Odd = 2 };

struct SerialConfig {
    std::string path;            ///< e.g. "/dev/ttyUSB0" or "/dev/serial/by-id/usb-..."
    int         baud      = 1200;
    Parity      parity    = Parity::None;
    int         stop_bits = 2;   ///< 1 or 2
};

/// Parse "none"/"even"/"odd" (case-insensitive). False on anything else.
bool parse_parity(const std::string& s, Parity& out);

const char* parity_name(Parity p);

/// True for the rates the optical head supports (300..9600 and the USB-serial usual 19200+).
bool is_supported_baud(int baud);

class SerialStream : public ByteStream {
public:
    SerialStream() = default;
    ~SerialStream() override;

    SerialStream(const SerialStream&) = delete;
    SerialStream& operator=(const SerialStream&) = delete;

    /**
     * @brief Open and configure the TTY.
     * @return false with err=TransportFailure if the device cannot be opened or configured.
     */
    bool open(const SerialConfig& cfg, Error& err);

    void close();

    bool is_open() const { return fd_ >= 0; }

    /// Mirror traffic into @p t (may be nullptr). The Trace must outlive the stream.
    void set_trace(Trace* t) { trace_ = t; }

    bool       write(const std::vector<uint8_t>& bytes) override;
    ReadResult read_until(const std::function<bool(uint8_t)>& done,
                          int timeout_ms,
                          std::vector<uint8_t>& out) override;
    void       discard_input() override;
    const char* name() const override { return "serial"; }

private:
    int    fd_    = -1;
    Trace* trace_ = nullptr;
};

} // namespace kamlink
