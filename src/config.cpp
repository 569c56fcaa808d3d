// ============================================================================
// config.cpp — implementation for config.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file config.cpp
 */

#include "kamlink/config.hpp"
#include "kamlink/frame_codec.hpp"
#include "kamlink/log.hpp"

#include <nlohmann/json.hpp>

#include <climits>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <utility>

using nlohmann::json;

namespace kamlink {

// ---------------------------------------------------------------------------
// Typed field readers: absent key leaves the optional empty, wrong type fails
// ---------------------------------------------------------------------------

static bool read_string(const json& j, const char* key, std::optional<std::string>& out, std::string& why) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) { why = std::string("'") + key + "' must be a string"; return false; }
    out = it->get<std::string>();
    return true;
}

static bool read_int(const json& j, const char* key, std::optional<int>& out, std::string& why) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    const bool in_range = it->is_number_unsigned()
        ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(INT_MAX)
        : it->is_number_integer() && it->get<std::int64_t>() >= INT_MIN && it->get<std::int64_t>() <= INT_MAX;
    if (!in_range) { why = std::string("'") + key + "' must be an integer in int range"; return false; }
    out = static_cast<int>(it->get<std::int64_t>());
    return true;
}

static const char* const KNOWN_KEYS[] = {
    "device", "host", "port", "baud", "parity", "stop_bits",
    "timeout_ms", "retries", "batch", "debug_file", "values"
};

bool parse_config_json(const std::string& text, ConfigPatch& out, std::string& why) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) { why = "invalid JSON"; return false; }
    if (!j.is_object())   { why = "top level must be an object"; return false; }

    ConfigPatch p;
    if (!read_string(j, "device", p.device, why))         return false;
    if (!read_string(j, "host", p.host, why))             return false;
    if (!read_int(j, "port", p.port, why))                return false;
    if (!read_int(j, "baud", p.baud, why))                return false;
    if (!read_int(j, "stop_bits", p.stop_bits, why))      return false;
    if (!read_int(j, "timeout_ms", p.timeout_ms, why))    return false;
    if (!read_int(j, "retries", p.retries, why))          return false;
    if (!read_int(j, "batch", p.batch, why))              return false;
    if (!read_string(j, "debug_file", p.debug_file, why)) return false;

    std::optional<std::string> parity;
    if (!read_string(j, "parity", parity, why)) return false;
    if (parity) {
        Parity par;
        if (!parse_parity(*parity, par)) { why = "'parity' must be none, even or odd"; return false; }
        p.parity = par;
    }

    auto v = j.find("values");
    if (v != j.end()) {
        if (!v->is_array()) { why = "'values' must be an array of strings"; return false; }
        std::vector<std::string> vals;
        for (const auto& e : *v) {
            if (!e.is_string()) { why = "'values' must be an array of strings"; return false; }
            vals.push_back(e.get<std::string>());
        }
        p.values = std::move(vals);
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        bool known = false;
        for (const char* k : KNOWN_KEYS) if (it.key() == k) { known = true; break; }
        if (!known) log_warn("reason=unknown_config_key key=" + it.key());
    }

    out = std::move(p);
    return true;
}

bool load_config_file(const std::string& path, ConfigPatch& out, std::string& why) {
    std::ifstream in(path);
    if (!in) { why = "cannot open " + path; return false; }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (!parse_config_json(ss.str(), out, why)) {
        why = path + ": " + why;
        return false;
    }
    return true;
}

void apply_patch(const ConfigPatch& p, RunConfig& cfg) {
    if (p.device)     cfg.device     = *p.device;
    if (p.host)       cfg.host       = *p.host;
    if (p.port)       cfg.port       = *p.port;
    if (p.baud)       cfg.baud       = *p.baud;
    if (p.parity)     cfg.parity     = *p.parity;
    if (p.stop_bits)  cfg.stop_bits  = *p.stop_bits;
    if (p.timeout_ms) cfg.timeout_ms = *p.timeout_ms;
    if (p.retries)    cfg.retries    = *p.retries;
    if (p.batch)      cfg.batch      = *p.batch;
    if (p.debug_file) cfg.debug_file = *p.debug_file;
    if (p.values)     cfg.values     = *p.values;
}

bool validate_config(const RunConfig& cfg, std::string& why) {
    if (!is_supported_baud(cfg.baud)) {
        why = "unsupported baud rate " + std::to_string(cfg.baud);
        return false;
    }
    if (cfg.stop_bits != 1 && cfg.stop_bits != 2) {
        why = "stop bits must be 1 or 2";
        return false;
    }
    if (cfg.timeout_ms <= 0) {
        why = "timeout must be positive";
        return false;
    }
    if (cfg.retries < 0) {
        why = "retries must not be negative";
        return false;
    }
    if (cfg.batch < 1 || cfg.batch > static_cast<int>(kmp::MAX_IDS_PER_FRAME)) {
        why = "batch must be 1.." + std::to_string(kmp::MAX_IDS_PER_FRAME);
        return false;
    }
    if (cfg.port < 1 || cfg.port > 65535) {
        why = "port must be 1..65535";
        return false;
    }
    return true;
}

SerialConfig serial_config(const RunConfig& cfg) {
    SerialConfig s;
    s.path      = cfg.device;
    s.baud      = cfg.baud;
    s.parity    = cfg.parity;
    s.stop_bits = cfg.stop_bits;
    return s;
}

SessionOptions session_options(const RunConfig& cfg) {
    SessionOptions o;
    o.timeout_ms  = cfg.timeout_ms;
    o.max_retries = cfg.retries;
    o.max_batch   = static_cast<std::size_t>(cfg.batch);
    return o;
}

DomoticzConfig domoticz_config(const RunConfig& cfg) {
    DomoticzConfig d;
    d.host = cfg.host;
    d.port = cfg.port;
    return d;
}

} // namespace kamlink
