#pragma once
/**
 * @page kl-meter-session KamLink Meter Session
 * @file meter_session.hpp
 * @brief Request/response exchange with one meter: batching, timeouts, retries.
 *
 * @details
 * PURPOSE
 * -------
 * MeterSession is the only code that decides *when* bytes move. It asks the
 * codec for a request frame, writes it, assembles the reply from the stream,
 * has the codec validate it, and turns the fields into Readings. If anything in
 * that chain smells wrong it throws the reply away and asks again.
 *
 * PROCESS FLOW (per batch)
 * ------------------------
 *   1) kmp::encode_request(batch)          -> InvalidCommandId ends the query
 *   2) stream.discard_input(); write       -> I/O failure ends the query
 *   3) read_until(FrameAssembler complete) -> Timeout: retry
 *   4) kmp::decode_response                -> CrcMismatch / MalformedFrame: retry
 *   5) ids in reply == ids in batch        -> otherwise MalformedFrame: retry
 *   6) to_reading() each field, append to the catalog
 *
 * RETRY POLICY
 * ------------
 * Each batch gets 1 + max_retries attempts, back to back. There is no backoff:
 * the meter has no congestion state, and the usual failure (IR port asleep,
 * first frame lost) is cured by simply asking again. When the budget is gone the
 * query fails with MeterUnreachable and the catalog is left untouched; a query
 * never returns a partial result.
 *
 * BATCHING
 * --------
 * GetRegister accepts a handful of registers per frame (8 on the Multical 402).
 * Longer id lists are split into consecutive batches of max_batch. The catalog
 * lists batches in request order and, inside a batch, registers in the order the
 * meter answered.
 *
 * OWNERSHIP
 * ---------
 * The session borrows the stream and the registry; both must outlive it. The
 * session assumes exclusive use of the stream for its whole lifetime.
 */

#include "kamlink/byte_stream.hpp"
#include "kamlink/command_registry.hpp"
#include "kamlink/error.hpp"
#include "kamlink/reading.hpp"

#include <cstddef>
#include <vector>

namespace kamlink {

class Trace;

struct SessionOptions {
    int         timeout_ms  = 5000;  ///< per attempt, from end of write to stop marker
    int         max_retries = 3;     ///< extra attempts after the first
    std::size_t max_batch   = 8;     ///< registers per request frame (1..255)
};

class MeterSession {
public:
    MeterSession(ByteStream& stream, const CommandRegistry& registry,
                 SessionOptions opts = SessionOptions());

    /// Log CRC errors and malformed replies into the raw trace too (may be nullptr).
    void set_trace(Trace* t) { trace_ = t; }

    /**
     * @brief Read @p ids from the meter.
     *
     * @param ids  Register numbers to read. Duplicates are queried once.
     * @param out  Receives the readings on success; untouched on failure.
     * @param err  InvalidCommandId, or MeterUnreachable once retries are spent
     *             or the stream fails.
     */
    bool query(const std::vector<int>& ids, ReadingCatalog& out, Error& err);

    /// Every register in the registry, as listed by --test-meter.
    bool query_all(ReadingCatalog& out, Error& err);

    /// Request frames written so far (all batches, all attempts).
    std::size_t frames_sent() const { return frames_sent_; }

private:
    bool exchange(const std::vector<uint8_t>& request,
                     const std::vector<int>& batch,
                     std::vector<Reading>& readings,
                     Error& err);

    ByteStream&            stream_;
    const CommandRegistry& registry_;
    SessionOptions         opts_;
    Trace*                 trace_       = nullptr;
    std::size_t            frames_sent_ = 0;
};

} // namespace kamlink
