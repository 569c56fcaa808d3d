// ============================================================================
// frame_codec.cpp — implementation for frame_codec.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file frame_codec.cpp
 */

#include "kamlink/frame_codec.hpp"

#include <cstdlib>   // std::llabs

namespace kamlink {
namespace kmp {

// Offsets inside a GetRegister reply payload.
static constexpr std::size_t HEADER_LEN = 2;   // 3F 10
static constexpr std::size_t FIELD_HEAD = 5;   // id_hi id_lo unit len si_ex
static constexpr std::size_t CRC_LEN    = 2;

static constexpr uint8_t SIEX_NEG_VALUE = 0x80;
static constexpr uint8_t SIEX_NEG_EXP   = 0x40;
static constexpr uint8_t SIEX_EXP_MASK  = 0x3F;

bool is_reserved(uint8_t b) {
    return b == ACK || b == STOP || b == ESC || b == RESPONSE_START || b == REQUEST_START;
}

// ---------------------------------------------------------------------------
// crc16()
// -------
// Bit-serial CCITT as the meter firmware does it: shift each message bit into
// the low end of a 17-bit register and fold 0x1021 back in whenever bit 16
// pops out. Do not "optimize" into a table without re-checking every vector.
// ---------------------------------------------------------------------------
uint16_t crc16(const uint8_t* p, std::size_t n) {
    uint32_t reg = 0;
    for (std::size_t i = 0; i < n; ++i) {
        for (uint8_t mask = 0x80; mask != 0; mask >>= 1) {
            reg <<= 1;
            if (p[i] & mask) reg |= 1;
            if (reg & 0x10000) {
                reg &= 0xFFFF;
                reg ^= 0x1021;
            }
        }
    }
    return static_cast<uint16_t>(reg);
}

void escape(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out) {
    out.reserve(out.size() + n * 2);   // worst case: every byte stuffed
    for (std::size_t i = 0; i < n; ++i) {
        uint8_t b = in[i];
        if (is_reserved(b)) {
            out.push_back(ESC);
            out.push_back(static_cast<uint8_t>(b ^ ESC_MASK));
        } else {
            out.push_back(b);
        }
    }
}

bool unescape(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out, Error& err) {
    out.reserve(out.size() + n);
    for (std::size_t i = 0; i < n; ++i) {
        if (in[i] != ESC) {
            out.push_back(in[i]);
            continue;
        }
        if (i + 1 >= n) {                       // ESC was the last byte
            err = Error::MalformedFrame;
            return false;
        }
        uint8_t b = static_cast<uint8_t>(in[++i] ^ ESC_MASK);
        if (!is_reserved(b)) {                  // nothing legitimate is stuffed like this
            err = Error::MalformedFrame;
            return false;
        }
        out.push_back(b);
    }
    return true;
}

void build_frame(uint8_t start, const std::vector<uint8_t>& payload, std::vector<uint8_t>& out) {
    std::vector<uint8_t> body(payload);
    body.push_back(0);                          // CRC placeholder
    body.push_back(0);
    uint16_t crc = crc16(body);
    body[body.size() - 2] = static_cast<uint8_t>(crc >> 8);
    body[body.size() - 1] = static_cast<uint8_t>(crc & 0xFF);

    out.clear();
    out.push_back(start);
    escape(body.data(), body.size(), out);
    out.push_back(STOP);
}

bool open_frame(const std::vector<uint8_t>& raw, uint8_t start,
                std::vector<uint8_t>& payload, Error& err) {
    payload.clear();

    if (raw.size() < 2 || raw.front() != start || raw.back() != STOP) {
        err = Error::MalformedFrame;
        return false;
    }

    std::vector<uint8_t> body;
    if (!unescape(raw.data() + 1, raw.size() - 2, body, err)) return false;

    if (body.size() < CRC_LEN + 1) {            // at least one payload byte
        err = Error::MalformedFrame;
        return false;
    }
    if (crc16(body) != 0) {
        err = Error::CrcMismatch;
        return false;
    }

    body.resize(body.size() - CRC_LEN);
    payload.swap(body);
    return true;
}

bool encode_request(const std::vector<int>& ids, std::vector<uint8_t>& frame, Error& err) {
    frame.clear();
    if (ids.empty() || ids.size() > MAX_IDS_PER_FRAME) {
        err = Error::InvalidCommandId;
        return false;
    }

    std::vector<uint8_t> payload;
    payload.reserve(HEADER_LEN + 1 + ids.size() * 2);
    payload.push_back(DEST_HEAT_METER);
    payload.push_back(CID_GET_REGISTER);
    payload.push_back(static_cast<uint8_t>(ids.size()));
    for (int id : ids) {
        if (id < 0 || id > MAX_COMMAND_ID) {
            err = Error::InvalidCommandId;
            return false;
        }
        payload.push_back(static_cast<uint8_t>(id >> 8));
        payload.push_back(static_cast<uint8_t>(id & 0xFF));
    }

    build_frame(REQUEST_START, payload, frame);
    return true;
}

bool decode_response(const std::vector<uint8_t>& raw, std::vector<RawField>& fields, Error& err) {
    fields.clear();

    std::vector<uint8_t> p;
    if (!open_frame(raw, RESPONSE_START, p, err)) return false;

    if (p.size() < HEADER_LEN || p[0] != DEST_HEAT_METER || p[1] != CID_GET_REGISTER) {
        err = Error::MalformedFrame;
        return false;
    }

    std::vector<RawField> out;
    std::size_t i = HEADER_LEN;
    while (i < p.size()) {
        if (i + FIELD_HEAD > p.size()) {        // truncated field header
            err = Error::MalformedFrame;
            return false;
        }

        RawField f;
        f.command_id = (p[i] << 8) | p[i + 1];
        f.unit_code  = p[i + 2];
        std::size_t len = p[i + 3];
        uint8_t si_ex   = p[i + 4];
        i += FIELD_HEAD;

        if (len == 0 || len > MAX_MANTISSA_LEN || i + len > p.size()) {
            err = Error::MalformedFrame;
            return false;
        }

        uint64_t mantissa = 0;
        for (std::size_t k = 0; k < len; ++k) {
            mantissa = (mantissa << 8) | p[i + k];
        }
        i += len;

        if (mantissa > static_cast<uint64_t>(INT64_MAX)) {
            err = Error::MalformedFrame;
            return false;
        }

        f.raw_magnitude = static_cast<int64_t>(mantissa);
        if (si_ex & SIEX_NEG_VALUE) f.raw_magnitude = -f.raw_magnitude;

        f.decimal_exponent = si_ex & SIEX_EXP_MASK;
        if (si_ex & SIEX_NEG_EXP) f.decimal_exponent = -f.decimal_exponent;

        out.push_back(f);
    }

    if (out.empty()) {                          // header only: meter knew none of the ids
        err = Error::MalformedFrame;
        return false;
    }

    fields.swap(out);
    return true;
}

bool encode_response(const std::vector<RawField>& fields, std::vector<uint8_t>& frame, Error& err) {
    frame.clear();
    if (fields.empty()) {
        err = Error::MalformedFrame;
        return false;
    }

    std::vector<uint8_t> payload;
    payload.push_back(DEST_HEAT_METER);
    payload.push_back(CID_GET_REGISTER);

    for (const auto& f : fields) {
        if (f.command_id < 0 || f.command_id > MAX_COMMAND_ID) {
            err = Error::InvalidCommandId;
            return false;
        }
        int exp_mag = f.decimal_exponent < 0 ? -f.decimal_exponent : f.decimal_exponent;
        if (exp_mag > SIEX_EXP_MASK || f.raw_magnitude == INT64_MIN) {
            err = Error::MalformedFrame;
            return false;
        }

        uint64_t mantissa = static_cast<uint64_t>(std::llabs(f.raw_magnitude));
        std::vector<uint8_t> be;
        do {
            be.insert(be.begin(), static_cast<uint8_t>(mantissa & 0xFF));
            mantissa >>= 8;
        } while (mantissa != 0);

        uint8_t si_ex = static_cast<uint8_t>(exp_mag);
        if (f.decimal_exponent < 0) si_ex |= SIEX_NEG_EXP;
        if (f.raw_magnitude < 0)    si_ex |= SIEX_NEG_VALUE;

        payload.push_back(static_cast<uint8_t>(f.command_id >> 8));
        payload.push_back(static_cast<uint8_t>(f.command_id & 0xFF));
        payload.push_back(f.unit_code);
        payload.push_back(static_cast<uint8_t>(be.size()));
        payload.push_back(si_ex);
        payload.insert(payload.end(), be.begin(), be.end());
    }

    build_frame(RESPONSE_START, payload, frame);
    return true;
}

// ---------------------------------------------------------------------------
// FrameAssembler
// --------------
// Markers are always stuffed inside a frame, so a raw start byte always opens
// a new frame and a raw STOP always closes the current one.
// ---------------------------------------------------------------------------
bool FrameAssembler::feed(uint8_t b) {
    if (complete_) {                // previous frame was handed out; start over
        buf_.clear();
        complete_ = false;
    }

    if (b == start_) {
        if (in_frame_) discarded_ += buf_.size();   // abandoned partial frame
        buf_.clear();
        buf_.push_back(b);
        in_frame_ = true;
        return false;
    }

    if (!in_frame_) {
        ++discarded_;               // echo of our request or line noise
        return false;
    }

    buf_.push_back(b);
    if (b == STOP) {
        in_frame_ = false;
        complete_ = true;
        return true;
    }
    return false;
}

void FrameAssembler::reset() {
    buf_.clear();
    in_frame_  = false;
    complete_  = false;
    discarded_ = 0;
}

} // namespace kmp
} // namespace kamlink
