// ============================================================================
// meter_session.cpp — implementation for meter_session.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file meter_session.cpp
 */

#include "kamlink/meter_session.hpp"
#include "kamlink/frame_codec.hpp"
#include "kamlink/log.hpp"
#include "kamlink/trace.hpp"

#include <algorithm>   // std::find, std::min
#include <sstream>     // id lists for log lines

namespace kamlink {

static std::string join_ids(const std::vector<int>& ids) {
    std::ostringstream os;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i) os << ',';
        os << ids[i];
    }
    return os.str();
}

static std::string hex_bytes(const std::vector<uint8_t>& v) {
    static const char* HEX = "0123456789abcdef";
    std::string s;
    s.reserve(v.size() * 3);
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) s.push_back(' ');
        s.push_back(HEX[v[i] >> 4]);
        s.push_back(HEX[v[i] & 0x0F]);
    }
    return s;
}

MeterSession::MeterSession(ByteStream& stream, const CommandRegistry& registry, SessionOptions opts)
    : stream_(stream), registry_(registry), opts_(opts) {
    if (opts_.max_retries < 0) opts_.max_retries = 0;
    if (opts_.max_batch == 0) opts_.max_batch = 1;
    if (opts_.max_batch > kmp::MAX_IDS_PER_FRAME) opts_.max_batch = kmp::MAX_IDS_PER_FRAME;
}

// ---------------------------------------------------------------------------
// exchange()
// ----------
// One attempt: write, assemble, decode, match. On failure err says why;
// query() asks is_retryable() whether another frame is worth sending.
// ---------------------------------------------------------------------------
bool MeterSession::exchange(const std::vector<uint8_t>& request,
                            const std::vector<int>& batch,
                            std::vector<Reading>& readings,
                            Error& err) {
    stream_.discard_input();                       // stale bytes from an earlier timeout

    if (log_enabled(LogLevel::Debug)) log_debug("tx=" + hex_bytes(request));
    ++frames_sent_;
    if (!stream_.write(request)) {
        err = Error::TransportFailure;
        return false;
    }

    kmp::FrameAssembler asm_reply;
    std::vector<uint8_t> raw;
    ReadResult rr = stream_.read_until([&asm_reply](uint8_t b) { return asm_reply.feed(b); },
                                       opts_.timeout_ms, raw);
    if (rr == ReadResult::Error) {
        err = Error::TransportFailure;
        return false;
    }
    if (rr == ReadResult::Timeout) {
        err = Error::Timeout;
        return false;
    }

    const std::vector<uint8_t>& frame = asm_reply.frame();
    if (log_enabled(LogLevel::Debug)) log_debug("rx=" + hex_bytes(frame));

    std::vector<kmp::RawField> fields;
    if (!kmp::decode_response(frame, fields, err)) {
        if (trace_) trace_->msg(err == Error::CrcMismatch ? "CRC error" : "Malformed frame");
        return false;
    }

    // Every requested register exactly once, nothing else.
    bool match = fields.size() == batch.size();
    for (std::size_t i = 0; match && i < fields.size(); ++i) {
        match = std::find(batch.begin(), batch.end(), fields[i].command_id) != batch.end();
        for (std::size_t k = 0; match && k < i; ++k) {
            match = fields[k].command_id != fields[i].command_id;
        }
    }
    if (!match) {
        if (trace_) trace_->msg("Response register mismatch");
        err = Error::MalformedFrame;
        return false;
    }

    readings.clear();
    for (const auto& f : fields) readings.push_back(to_reading(f));
    return true;
}

bool MeterSession::query(const std::vector<int>& ids, ReadingCatalog& out, Error& err) {
    std::vector<int> wanted;
    for (int id : ids) {
        if (std::find(wanted.begin(), wanted.end(), id) == wanted.end()) wanted.push_back(id);
    }
    if (wanted.empty()) {
        err = Error::InvalidCommandId;
        return false;
    }

    ReadingCatalog result;
    const int attempts_per_batch = 1 + opts_.max_retries;

    for (std::size_t start = 0; start < wanted.size(); start += opts_.max_batch) {
        std::size_t stop = std::min(wanted.size(), start + opts_.max_batch);
        std::vector<int> batch(wanted.begin() + start, wanted.begin() + stop);

        std::vector<uint8_t> request;
        if (!kmp::encode_request(batch, request, err)) {
            log_error(std::string("reason=") + error_reason(err) + " ids=" + join_ids(batch));
            return false;
        }
        log_info("stage=query ids=" + join_ids(batch));

        std::vector<Reading> readings;
        bool done = false;
        for (int attempt = 1; attempt <= attempts_per_batch; ++attempt) {
            Error aerr = Error::None;
            if (exchange(request, batch, readings, aerr)) {
                done = true;
                break;
            }
            log_warn(std::string("reason=") + error_reason(aerr)
                     + " attempt=" + std::to_string(attempt) + "/" + std::to_string(attempts_per_batch)
                     + " ids=" + join_ids(batch));
            if (!is_retryable(aerr)) break;
        }

        if (!done) {
            err = Error::MeterUnreachable;
            log_error(std::string("reason=") + error_reason(err) + " ids=" + join_ids(batch));
            return false;
        }

        for (const auto& r : readings) result.add(r);   // meter's reply order
    }

    out = result;
    return true;
}

bool MeterSession::query_all(ReadingCatalog& out, Error& err) {
    return query(registry_.ids(), out, err);
}

} // namespace kamlink
