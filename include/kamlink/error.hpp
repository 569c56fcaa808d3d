#pragma once
/**
 * @page kl-error KamLink Error Codes
 * @file error.hpp
 * @brief One enum for every failure the reader, the processor and the collaborators can report.
 *
 * @details
 * PURPOSE
 * -------
 * KamLink does not throw across module boundaries. Every fallible call returns
 * `bool` and fills an `Error` out-parameter, the same shape the command builders
 * use with their `std::string& err`. The enum keeps call sites honest (switchable,
 * no string compares), and error_reason() turns it back into the stable snake_case
 * token printed in `status=error reason=...` lines so scripts can grep for it.
 *
 * TAXONOMY
 * --------
 *   Protocol      CrcMismatch, MalformedFrame, InvalidCommandId, Timeout
 *                 -> fatal for the current request frame, retried by MeterSession,
 *                    escalated to MeterUnreachable when the budget runs out.
 *   Lookup        UnknownCommand, UnknownUnit
 *                 -> unit lookup degrades to an unlabeled value; command lookup
 *                    fails the one output that asked for it.
 *   Request       InvalidRequest
 *                 -> that processing request is reported and skipped.
 *   Collaborator  ValueUnavailable, DeviceNotFound, SinkFailure, TransportFailure,
 *                 MeterUnreachable
 *                 -> propagated as-is; fatal for the affected output only, except
 *                    MeterUnreachable which aborts the run.
 */

#include <cstdint>

namespace kamlink {

enum class Error : uint8_t {
    None = 0,

    // protocol
    CrcMismatch,
    MalformedFrame,
    InvalidCommandId,
    Timeout,

    // lookup
    UnknownCommand,
    UnknownUnit,

    // request
    InvalidRequest,

    // collaborators
    ValueUnavailable,
    DeviceNotFound,
    SinkFailure,
    TransportFailure,
    MeterUnreachable
};

enum class ErrorClass : uint8_t {
    None = 0,
    Protocol,
    Lookup,
    Request,
    Collaborator
};

/**
 * @brief Stable, script-friendly token for an error ("crc_mismatch", "invalid_request", ...).
 *
 * The returned pointer refers to a string literal; never null.
 */
const char* error_reason(Error e);

/// Taxonomy bucket for @p e (see the table above).
ErrorClass error_class(Error e);

/// "protocol", "lookup", "request", "collaborator" or "none"; the `class=` token in run logs.
const char* error_class_name(ErrorClass c);

/**
 * @brief True for errors MeterSession answers with a fresh request frame.
 *
 * CrcMismatch, MalformedFrame and Timeout mean "the meter might answer cleanly
 * next time". InvalidCommandId does not: the same ids would fail the same way.
 */
bool is_retryable(Error e);

} // namespace kamlink
