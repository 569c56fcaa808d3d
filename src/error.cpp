// ============================================================================
// error.cpp — implementation for error.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "kamlink/error.hpp"

namespace kamlink {

const char* error_reason(Error e) {
    switch (e) {
        case Error::None:             return "none";
        case Error::CrcMismatch:      return "crc_mismatch";
        case Error::MalformedFrame:   return "malformed_frame";
        case Error::InvalidCommandId: return "invalid_command_id";
        case Error::Timeout:          return "timeout";
        case Error::UnknownCommand:   return "unknown_command";
        case Error::UnknownUnit:      return "unknown_unit";
        case Error::InvalidRequest:   return "invalid_request";
        case Error::ValueUnavailable: return "value_unavailable";
        case Error::DeviceNotFound:   return "device_not_found";
        case Error::SinkFailure:      return "sink_failure";
        case Error::TransportFailure: return "transport_failure";
        case Error::MeterUnreachable: return "meter_unreachable";
    }
    return "unknown_error";
}

ErrorClass error_class(Error e) {
    switch (e) {
        case Error::None:
            return ErrorClass::None;

        case Error::CrcMismatch:
        case Error::MalformedFrame:
        case Error::InvalidCommandId:
        case Error::Timeout:
            return ErrorClass::Protocol;

        case Error::UnknownCommand:
        case Error::UnknownUnit:
            return ErrorClass::Lookup;

        case Error::InvalidRequest:
            return ErrorClass::Request;

        case Error::ValueUnavailable:
        case Error::DeviceNotFound:
        case Error::SinkFailure:
        case Error::TransportFailure:
        case Error::MeterUnreachable:
            return ErrorClass::Collaborator;
    }
    return ErrorClass::Collaborator;
}

const char* error_class_name(ErrorClass c) {
    switch (c) {
        case ErrorClass::None:         return "none";
        case ErrorClass::Protocol:     return "protocol";
        case ErrorClass::Lookup:       return "lookup";
        case ErrorClass::Request:      return "request";
        case ErrorClass::Collaborator: return "collaborator";
    }
    return "none";
}

bool is_retryable(Error e) {
    return e == Error::CrcMismatch
        || e == Error::MalformedFrame
        || e == Error::Timeout;
}

} // namespace kamlink
