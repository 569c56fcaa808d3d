// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "kamlink/serial_io.hpp"
#include "kamlink/trace.hpp"
#include "kamlink/log.hpp"

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for timeout-based read loop
#include <cerrno>          // errno / EINTR / EAGAIN
#include <cstring>         // std::strerror
#include <cctype>          // std::tolower
#include <chrono>          // steady_clock deadline for read_until

namespace kamlink {

// ---------------------------------------------------------------------------
// baud_constant()
// ---------------
// Map an integer rate to its termios constant. Returns false for rates the
// driver has no constant for, so a typo fails loudly instead of silently
// talking at the wrong speed.
// ---------------------------------------------------------------------------
static bool baud_constant(int baud, speed_t& out) {
    switch (baud) {
        case 300:  out = B300;  return true;
        case 600:  out = B600;  return true;
        case 1200: out = B1200; return true;
        case 2400: out = B2400; return true;
        case 4800: out = B4800; return true;
        case 9600: out = B9600; return true;
        default:   return false;
    }
}

bool is_supported_baud(int baud) {
    speed_t sp;
    return baud_constant(baud, sp);
}

bool parse_parity(const std::string& s, Parity& out) {
    std::string l;
    for (char c : s) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (l == "none" || l == "n") { out = Parity::None; return true; }
    if (l == "even" || l == "e") { out = Parity::Even; return true; }
    if (l == "odd"  || l == "o") { out = Parity::Odd;  return true; }
    return false;
}

const char* parity_name(Parity p) {
    switch (p) {
        case Parity::None: return "none";
        case Parity::Even: return "even";
        case Parity::Odd:  return "odd";
    }
    return "none";
}

// ---------------------------------------------------------------------------
// set_raw()
// ---------
// Raw 8-bit I/O with the requested parity and stop bits.
// - No echo, no line discipline, no flow control.
// - VMIN=0, VTIME=0: reads never block; poll() does the waiting.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud, Parity parity, int stop_bits) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cflag &= ~CSIZE;
    tio.c_cflag |= CS8;

    tio.c_cflag &= ~(PARENB | PARODD);
    if (parity == Parity::Even) tio.c_cflag |= PARENB;
    if (parity == Parity::Odd)  tio.c_cflag |= (PARENB | PARODD);

    if (stop_bits == 2) tio.c_cflag |= CSTOPB;
    else                tio.c_cflag &= ~CSTOPB;

    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

SerialStream::~SerialStream() {
    close();
}

bool SerialStream::open(const SerialConfig& cfg, Error& err) {
    close();

    speed_t sp;
    if (!baud_constant(cfg.baud, sp) || (cfg.stop_bits != 1 && cfg.stop_bits != 2)) {
        log_error("reason=bad_line_settings baud=" + std::to_string(cfg.baud)
                  + " stop_bits=" + std::to_string(cfg.stop_bits));
        err = Error::TransportFailure;
        return false;
    }

    int fd = ::open(cfg.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        log_error("reason=open_failed dev=" + cfg.path + " errno=" + std::strerror(errno));
        err = Error::TransportFailure;
        return false;
    }

    if (!set_raw(fd, sp, cfg.parity, cfg.stop_bits)) {
        log_error("reason=termios_failed dev=" + cfg.path + " errno=" + std::strerror(errno));
        ::close(fd);
        err = Error::TransportFailure;
        return false;
    }

    fd_ = fd;
    log_info("stage=open dev=" + cfg.path + " baud=" + std::to_string(cfg.baud)
             + " parity=" + parity_name(cfg.parity)
             + " stop_bits=" + std::to_string(cfg.stop_bits));
    return true;
}

void SerialStream::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ---------------------------------------------------------------------------
// write()
// -------
// Loop until the whole frame is out. The fd is non-blocking, so EAGAIN means
// the driver queue is full: wait for POLLOUT instead of spinning.
// ---------------------------------------------------------------------------
bool SerialStream::write(const std::vector<uint8_t>& bytes) {
    if (fd_ < 0) return false;
    if (trace_) trace_->tx(bytes);

    std::size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = ::write(fd_, bytes.data() + off, bytes.size() - off);
        if (n > 0) {
            off += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd_, POLLOUT, 0};
            if (::poll(&pfd, 1, 1000) <= 0) return false;
            continue;
        }
        log_error(std::string("reason=write_failed errno=") + std::strerror(errno));
        return false;
    }
    // Frame fully on the wire before the caller starts the reply clock.
    if (tcdrain(fd_) != 0) log_warn(std::string("reason=drain_failed errno=") + std::strerror(errno));
    return true;
}

// ---------------------------------------------------------------------------
// read_until()
// ------------
// poll() with the time left until the deadline, then read one byte and ask the
// caller whether the reply is complete.
// ---------------------------------------------------------------------------
ReadResult SerialStream::read_until(const std::function<bool(uint8_t)>& done,
                                    int timeout_ms,
                                    std::vector<uint8_t>& out) {
    if (fd_ < 0) return ReadResult::Error;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    pollfd pfd{fd_, POLLIN, 0};

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (left <= 0) {
            if (trace_) trace_->msg("Rx Timeout");
            return ReadResult::Timeout;
        }

        int pr = ::poll(&pfd, 1, static_cast<int>(left));
        if (pr == 0) continue;                      // loop re-checks the deadline
        if (pr < 0) {
            if (errno == EINTR) continue;
            log_error(std::string("reason=poll_failed errno=") + std::strerror(errno));
            return ReadResult::Error;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            log_error("reason=device_gone");
            return ReadResult::Error;
        }

        uint8_t byte = 0;
        ssize_t n = ::read(fd_, &byte, 1);
        if (n == 1) {
            if (trace_) trace_->rx(&byte, 1);
            out.push_back(byte);
            if (done(byte)) return ReadResult::Ok;
            continue;
        }
        if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
        log_error(std::string("reason=read_failed errno=") + std::strerror(errno));
        return ReadResult::Error;
    }
}

void SerialStream::discard_input() {
    if (fd_ >= 0) tcflush(fd_, TCIFLUSH);
}

} // namespace kamlink
