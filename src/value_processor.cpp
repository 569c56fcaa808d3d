// ============================================================================
// value_processor.cpp — implementation for value_processor.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file value_processor.cpp
 */

#include "kamlink/value_processor.hpp"
#include "kamlink/log.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>   // std::strtol
#include <sstream>
#include <vector>

namespace kamlink {

const char* mode_name(Mode m) {
    switch (m) {
        case Mode::Overwrite: return "overwrite";
        case Mode::Subtract:  return "subtract";
        case Mode::Add:       return "add";
    }
    return "?";
}

bool ProcessingRequest::validate(Error& err) const {
    if (target_device_id < 0 || command_id < 0 || command_id > 0xFFFF) {
        err = Error::InvalidRequest;
        return false;
    }
    const bool needs_comparison = (mode == Mode::Subtract || mode == Mode::Add);
    if (needs_comparison != comparison_device_id.has_value()) {
        err = Error::InvalidRequest;
        return false;
    }
    if (comparison_device_id && *comparison_device_id < 0) {
        err = Error::InvalidRequest;
        return false;
    }
    err = Error::None;
    return true;
}

std::string ProcessingRequest::to_string() const {
    std::ostringstream os;
    os << target_device_id << ':' << command_id << ':' << static_cast<int>(mode);
    if (comparison_device_id) os << ':' << *comparison_device_id;
    return os.str();
}

// ---------------------------------------------------------------------------
// Request string parsing
// ---------------------------------------------------------------------------

// Whole-string integer in C notation (decimal, 0x.., leading 0 = octal).
// No sign and no surrounding blanks.
static bool parse_int_field(const std::string& s, int& out) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 0);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (v < 0 || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

static std::vector<std::string> split_colon(const std::string& text) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : text) {
        if (c == ':') { parts.push_back(cur); cur.clear(); }
        else          { cur += c; }
    }
    parts.push_back(cur);
    return parts;
}

bool parse_request(const std::string& text, ProcessingRequest& out, Error& err) {
    const auto parts = split_colon(text);
    if (parts.size() != 3 && parts.size() != 4) {
        err = Error::InvalidRequest;
        return false;
    }

    int fields[4] = {0, 0, 0, 0};
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (!parse_int_field(parts[i], fields[i])) {
            err = Error::InvalidRequest;
            return false;
        }
    }
    if (fields[2] > static_cast<int>(Mode::Add)) {
        err = Error::InvalidRequest;
        return false;
    }

    ProcessingRequest req;
    req.target_device_id = fields[0];
    req.command_id       = fields[1];
    req.mode             = static_cast<Mode>(fields[2]);
    if (parts.size() == 4) req.comparison_device_id = fields[3];

    if (!req.validate(err)) return false;
    out = req;
    return true;
}

// ---------------------------------------------------------------------------
// Processing
// ---------------------------------------------------------------------------

static bool fetch_required(const FetchValue& fetch, int device_id, double& out, Error& err) {
    Error cause = Error::None;
    if (fetch && fetch(device_id, out, cause)) return true;
    log_warn(std::string("reason=value_unavailable device=") + std::to_string(device_id) +
             " cause=" + error_reason(cause == Error::None ? Error::ValueUnavailable : cause));
    err = Error::ValueUnavailable;
    return false;
}

bool ValueProcessor::process(const ProcessingRequest& req, const Reading& reading,
                             const FetchValue& fetch, ProcessingResult& out, Error& err) {
    if (!req.validate(err)) return false;

    const double r = reading.value();
    double result = r;

    switch (req.mode) {
        case Mode::Overwrite:
            break;

        case Mode::Subtract: {
            double c = 0.0;
            if (!fetch_required(fetch, *req.comparison_device_id, c, err)) return false;
            result = r - c;
            break;
        }

        case Mode::Add: {
            double s = 0.0, c = 0.0;
            if (!fetch_required(fetch, req.target_device_id, s, err)) return false;
            if (!fetch_required(fetch, *req.comparison_device_id, c, err)) return false;
            result = s + (r - c);
            break;
        }
    }

    out.target_device_id = req.target_device_id;
    out.value            = result;
    err = Error::None;

    log_debug("op=process req=" + req.to_string() + " mode=" + mode_name(req.mode) +
              " reading=" + std::to_string(r) + " result=" + std::to_string(result));
    return true;
}

bool ValueProcessor::process(const ProcessingRequest& req, const Reading& reading,
                             ValueStore& store, ProcessingResult& out, Error& err) {
    FetchValue fetch = [&store](int id, double& v, Error& e) { return store.get_value(id, v, e); };
    return process(req, reading, fetch, out, err);
}

} // namespace kamlink
