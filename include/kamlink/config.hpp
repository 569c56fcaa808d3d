#pragma once
/**
 * @file config.hpp
 * @brief Run configuration: defaults, optional JSON file, command-line overrides.
 *
 * Precedence is defaults < config file < explicit command-line options. Both
 * sources are read into a ConfigPatch (every field optional) and applied in
 * that order, so "was this set?" is answered by the patch and never by
 * comparing against a default value.
 *
 * File keys: device, host, port, baud, parity ("none"/"even"/"odd"), stop_bits,
 * timeout_ms, retries, batch, debug_file, values (array of request strings).
 * Unknown keys are ignored with a warning.
 */

#include "kamlink/domoticz_client.hpp"
#include "kamlink/meter_session.hpp"
#include "kamlink/serial_io.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kamlink {

struct RunConfig {
    std::string device;
    std::string host       = "localhost";
    int         port       = 8080;
    int         baud       = 1200;
    Parity      parity     = Parity::None;
    int         stop_bits  = 2;
    int         timeout_ms = 5000;
    int         retries    = 3;
    int         batch      = 8;
    std::string debug_file;
    std::vector<std::string> values;

    bool verbose    = false;
    bool debug      = false;
    bool test_meter = false;
    bool test_sink  = false;
};

struct ConfigPatch {
    std::optional<std::string> device;
    std::optional<std::string> host;
    std::optional<int>         port;
    std::optional<int>         baud;
    std::optional<Parity>      parity;
    std::optional<int>         stop_bits;
    std::optional<int>         timeout_ms;
    std::optional<int>         retries;
    std::optional<int>         batch;
    std::optional<std::string> debug_file;
    std::optional<std::vector<std::string>> values;
};

/// Parse a JSON config document. False with @p why on syntax or type errors.
bool parse_config_json(const std::string& text, ConfigPatch& out, std::string& why);

/// Read and parse @p path. False with @p why when unreadable or invalid.
bool load_config_file(const std::string& path, ConfigPatch& out, std::string& why);

void apply_patch(const ConfigPatch& patch, RunConfig& cfg);

/// Range checks on the merged result (baud, stop bits, timeouts, batch, port).
bool validate_config(const RunConfig& cfg, std::string& why);

SerialConfig   serial_config(const RunConfig& cfg);
SessionOptions session_options(const RunConfig& cfg);
DomoticzConfig domoticz_config(const RunConfig& cfg);

} // namespace kamlink
