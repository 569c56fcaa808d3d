#pragma once

/**
 * @page kl-frame-codec KamLink Frame Codec (Kamstrup KMP)
 * @file frame_codec.hpp
 * @brief Byte stuffing, CRC-16 and GetRegister request/response framing for the optical head.
 *
 * @details
 * OVERVIEW
 * --------
 * A Multical 402 talks KMP over its IR port: every message is a start marker,
 * a byte-stuffed payload carrying a 16-bit CRC at its tail, and a stop marker.
 * This header turns a list of register numbers into a request frame, and a raw
 * reply frame back into register fields, and nothing else. Reading the port and
 * deciding what to do with failures live in MeterSession.
 *
 * WIRE LAYOUT
 * -----------
 *   request:   80 | 3F 10 <n> (<id_hi> <id_lo>) x n        <crc_hi> <crc_lo> | 0D
 *   response:  40 | 3F 10 (<id_hi> <id_lo> <unit> <len> <si_ex> <mantissa x len>)+ <crc> | 0D
 *
 *   3F        destination address of the heat meter
 *   10        command id GetRegister
 *   si_ex     bit7 negates the value, bit6 negates the exponent, bits0..5 exponent
 *   mantissa  big-endian unsigned, len bytes (1..8 accepted)
 *
 * BYTE STUFFING
 * -------------
 * Reserved values 06 0D 1B 40 80 never appear raw between the markers. Each one
 * is sent as ESC (1B) followed by the byte XOR FF:
 *
 *   payload 3F 10 00 40  ->  wire 3F 10 00 1B BF
 *
 * Decoding undoes the mask. An ESC with no following byte, or one whose
 * unmasked byte is not reserved, makes the frame malformed: the decoder drops
 * it rather than guess.
 *
 * CRC
 * ---
 * CCITT polynomial 0x1021, zero initial register, bits shifted in MSB first.
 * The sender appends two zero bytes, runs the CRC over payload+zeros and
 * overwrites the zeros with the result (big-endian). The receiver runs the same
 * CRC over payload+received CRC; zero means intact. This is the meter's own
 * routine and part of the wire contract, so it is kept bit-for-bit.
 *
 * STREAM ASSEMBLY
 * ---------------
 * FrameAssembler is fed one byte at a time from the serial read loop. It
 * ignores everything until a response start marker (which drops the optical
 * head's echo of our own request), restarts on every new start marker, and
 * completes on the stop marker. Because the markers are always stuffed inside
 * payloads, the boundary is unambiguous without looking inside.
 *
 * EXAMPLE
 * -------
 * @code
 *   std::vector<uint8_t> req;
 *   kamlink::Error err = kamlink::Error::None;
 *   kamlink::kmp::encode_request({60}, req, err);
 *   // req: 80 3F 10 01 00 3C B2 5F 0D
 *
 *   std::vector<kamlink::kmp::RawField> fields;
 *   if (!kamlink::kmp::decode_response(reply, fields, err)) {
 *       // err is CrcMismatch or MalformedFrame; do not trust reply
 *   }
 * @endcode
 */

#include "kamlink/error.hpp"

#include <vector>
#include <cstddef>
#include <cstdint>

namespace kamlink {
namespace kmp {

/**
 * @name Markers and escape codes
 * @{
 */
static constexpr uint8_t REQUEST_START  = 0x80;  ///< first byte of a host->meter frame
static constexpr uint8_t RESPONSE_START = 0x40;  ///< first byte of a meter->host frame
static constexpr uint8_t STOP           = 0x0D;  ///< last byte of every frame
static constexpr uint8_t ACK            = 0x06;  ///< acknowledge; reserved, never raw in payloads
static constexpr uint8_t ESC            = 0x1B;  ///< escape introducer
static constexpr uint8_t ESC_MASK       = 0xFF;  ///< escaped byte = plain byte ^ ESC_MASK
/** @} */

/**
 * @name GetRegister addressing
 * @{
 */
static constexpr uint8_t DEST_HEAT_METER  = 0x3F;
static constexpr uint8_t CID_GET_REGISTER = 0x10;
/** @} */

static constexpr std::size_t MAX_IDS_PER_FRAME = 255;  ///< count is a single byte
static constexpr std::size_t MAX_MANTISSA_LEN  = 8;    ///< fits an int64 magnitude
static constexpr int         MAX_COMMAND_ID    = 0xFFFF;

/// One decoded register field, exactly as the meter sent it.
struct RawField {
    int     command_id       = 0;
    int64_t raw_magnitude    = 0;   ///< carries the value sign (si_ex bit7)
    int     decimal_exponent = 0;   ///< carries the exponent sign (si_ex bit6)
    uint8_t unit_code        = 0;
};

/// True for 06 0D 1B 40 80.
bool is_reserved(uint8_t b);

/**
 * @brief Meter CRC-16 (poly 0x1021, init 0, shift-in) over @p n bytes.
 *
 * Over payload+00 00 it yields the CRC to transmit; over payload+CRC it yields 0.
 */
uint16_t crc16(const uint8_t* p, std::size_t n);

inline uint16_t crc16(const std::vector<uint8_t>& v) { return crc16(v.data(), v.size()); }

/**
 * @brief Byte-stuff @p n bytes, appending to @p out (not cleared).
 */
void escape(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out);

/**
 * @brief Undo byte stuffing, appending to @p out (not cleared).
 *
 * @return false with err=MalformedFrame on a trailing ESC or an escape that does
 *         not decode to a reserved byte.
 */
bool unescape(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out, Error& err);

/**
 * @brief Wrap a payload: append CRC, stuff, add @p start and STOP. Clears @p out first.
 */
void build_frame(uint8_t start, const std::vector<uint8_t>& payload, std::vector<uint8_t>& out);

/**
 * @brief Inverse of build_frame(): check markers, unstuff, verify and strip the CRC.
 *
 * @param raw      Complete wire frame, start marker through stop marker.
 * @param start    Expected start marker.
 * @param payload  Receives the payload without CRC on success (cleared first).
 * @return false with MalformedFrame (markers, stuffing, too short) or CrcMismatch.
 */
bool open_frame(const std::vector<uint8_t>& raw, uint8_t start,
                std::vector<uint8_t>& payload, Error& err);

/**
 * @brief Build a GetRegister request for @p ids (in order).
 *
 * @return false with InvalidCommandId if the list is empty, longer than
 *         MAX_IDS_PER_FRAME, or holds an id outside 0..0xFFFF.
 */
bool encode_request(const std::vector<int>& ids, std::vector<uint8_t>& frame, Error& err);

/**
 * @brief Validate and parse a GetRegister reply into its fields (meter order).
 *
 * @return false with CrcMismatch or MalformedFrame; @p fields is then empty.
 */
bool decode_response(const std::vector<uint8_t>& raw, std::vector<RawField>& fields, Error& err);

/**
 * @brief Meter side of decode_response(): frame @p fields as a GetRegister reply.
 *
 * The mantissa uses the fewest bytes that hold |raw_magnitude| (at least one).
 * Used by tests that need to play the meter.
 */
bool encode_response(const std::vector<RawField>& fields, std::vector<uint8_t>& frame, Error& err);

/**
 * @brief Byte-at-a-time reply assembler for the serial read loop.
 *
 * feed() returns true once a start..stop frame is complete; the bytes are then
 * in frame() (markers included, still stuffed) until the next feed().
 */
class FrameAssembler {
public:
    explicit FrameAssembler(uint8_t start = RESPONSE_START) : start_(start) {}

    bool feed(uint8_t b);

    const std::vector<uint8_t>& frame() const { return buf_; }

    /// Bytes dropped while hunting for a start marker (echo, line noise).
    std::size_t discarded() const { return discarded_; }

    void reset();

private:
    uint8_t              start_;
    std::vector<uint8_t> buf_;
    bool                 in_frame_  = false;
    bool                 complete_  = false;
    std::size_t          discarded_ = 0;
};

} // namespace kmp
} // namespace kamlink
