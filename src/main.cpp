// ============================================================================
// main.cpp — kamlink command-line entry point
// Reads registers from a Multical 402 over the optical head and pushes
// processed values to Domoticz. See runner.hpp for the run flow and exit codes.
// ============================================================================

#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "kamlink/command_registry.hpp"
#include "kamlink/config.hpp"
#include "kamlink/domoticz_client.hpp"
#include "kamlink/log.hpp"
#include "kamlink/meter_session.hpp"
#include "kamlink/runner.hpp"
#include "kamlink/serial_io.hpp"
#include "kamlink/trace.hpp"

using namespace kamlink;

static const char* const USAGE_FOOTER =
    "\nRequests are \"idx:CommandNr:mode\" (mode 0) or \"idx:CommandNr:mode:idx2\" (mode 1, 2).\n"
    "  mode 0  write the register value to device idx\n"
    "  mode 1  write register minus the value of device idx2 to idx\n"
    "  mode 2  add (register minus device idx2) onto the value of idx\n"
    "CommandNr values are listed by --test-meter, idx values by --test-sink.\n"
    "\nExamples:\n"
    "  kamlink -d /dev/ttyUSB0 88:60:0 89:80:0\n"
    "  kamlink -d /dev/ttyUSB0 --host 192.168.1.100 88:60:0 89:80:1:90\n";

int main(int argc, char** argv) {
    CLI::App app{"Kamstrup Multical 402 reader for Domoticz"};
    app.footer(USAGE_FOOTER);

    ConfigPatch cli;
    std::string device, host, parity, debug_file, config_path;
    int port = 0, baud = 0, stop_bits = 0, timeout_ms = 0, retries = 0, batch = 0;
    std::vector<std::string> values;
    bool verbose = false, debug = false, test_meter = false, test_sink = false;

    // ---- meter / serial ----
    auto* o_dev    = app.add_option("-d,--dev", device, "Serial device of the optical head (e.g. /dev/ttyUSB0)");
    auto* o_baud   = app.add_option("--baud", baud, "Baud rate (default 1200)");
    auto* o_parity = app.add_option("--parity", parity, "Parity: none|even|odd (default none)")
                         ->check(CLI::IsMember({"none", "even", "odd"}, CLI::ignore_case));
    auto* o_stop   = app.add_option("--stop-bits", stop_bits, "Stop bits 1|2 (default 2)")
                         ->check(CLI::IsMember({1, 2}));
    auto* o_tmo    = app.add_option("--timeout", timeout_ms, "Reply timeout per attempt in ms (default 5000)")
                         ->check(CLI::PositiveNumber);
    auto* o_retry  = app.add_option("--retries", retries, "Extra attempts per request frame (default 3)")
                         ->check(CLI::NonNegativeNumber);
    auto* o_batch  = app.add_option("--batch", batch, "Registers per request frame (default 8)")
                         ->check(CLI::Range(1, 255));

    // ---- sink ----
    auto* o_host = app.add_option("--host,--ip", host, "Domoticz host (default localhost)");
    auto* o_port = app.add_option("--port", port, "Domoticz port (default 8080)")->check(CLI::Range(1, 65535));

    // ---- diagnostics ----
    app.add_flag("--verbose", verbose, "Log progress (info level)");
    app.add_flag("--debug", debug, "Log frames and values (debug level)");
    auto* o_dbgf = app.add_option("--debug-file", debug_file, "Append raw serial traffic trace to this file");
    app.add_option("--config", config_path, "JSON config file; command-line options override it")
        ->check(CLI::ExistingFile);
    auto* o_tm = app.add_flag("--test-meter,--test_kamstrup", test_meter, "Read and print every register, then exit");
    auto* o_ts = app.add_flag("--test-sink,--test_domoticz", test_sink, "List Domoticz devices, then exit");
    o_tm->excludes(o_ts);

    auto* o_vals = app.add_option("values", values, "Requests idx:CommandNr:mode[:idx2]");

    CLI11_PARSE(app, argc, argv);

    // -------- logging first, so config problems are reported consistently --------
    set_log_level(debug ? LogLevel::Debug : verbose ? LogLevel::Info : LogLevel::Warn);

    // -------- merge: defaults < file < command line --------
    RunConfig cfg;
    if (!config_path.empty()) {
        ConfigPatch file;
        std::string why;
        if (!load_config_file(config_path, file, why)) {
            std::cerr << "status=error reason=bad_config detail=\"" << why << "\"\n";
            return EXIT_SETUP;
        }
        apply_patch(file, cfg);
    }

    if (o_dev->count())    cli.device     = device;
    if (o_host->count())   cli.host       = host;
    if (o_port->count())   cli.port       = port;
    if (o_baud->count())   cli.baud       = baud;
    if (o_stop->count())   cli.stop_bits  = stop_bits;
    if (o_tmo->count())    cli.timeout_ms = timeout_ms;
    if (o_retry->count())  cli.retries    = retries;
    if (o_batch->count())  cli.batch      = batch;
    if (o_dbgf->count())   cli.debug_file = debug_file;
    if (o_vals->count())   cli.values     = values;
    if (o_parity->count()) {
        Parity p;
        if (parse_parity(parity, p)) cli.parity = p;
    }
    apply_patch(cli, cfg);
    cfg.verbose    = verbose;
    cfg.debug      = debug;
    cfg.test_meter = test_meter;
    cfg.test_sink  = test_sink;

    {
        std::string why;
        if (!validate_config(cfg, why)) {
            std::cerr << "status=error reason=bad_config detail=\"" << why << "\"\n";
            return EXIT_USAGE;
        }
    }

    // -------- usage checks --------
    if (!cfg.test_meter && !cfg.test_sink && cfg.values.empty()) {
        std::cerr << "status=error reason=no_values hint=\"use --help\"\n";
        return EXIT_USAGE;
    }
    if (!cfg.test_sink && cfg.device.empty()) {
        std::cerr << "status=error reason=no_device hint=\"pass --dev <path>\"\n";
        return EXIT_USAGE;
    }

    // -------- collaborators --------
    Trace trace;
    if (!cfg.debug_file.empty() && !trace.open(cfg.debug_file)) {
        log_warn("reason=trace_open_failed path=" + cfg.debug_file);
    }

    const CommandRegistry& registry = CommandRegistry::multical402();
    SerialStream serial;
    MeterSession session(serial, registry, session_options(cfg));
    DomoticzClient sink(domoticz_config(cfg));

    if (trace.is_open()) {
        serial.set_trace(&trace);
        session.set_trace(&trace);
    }

    Runner runner(session, sink, registry, std::cout);

    if (cfg.test_sink) {
        std::cout << "\n=== Testing Domoticz connection (" << sink.base() << ") ===\n\n";
        return runner.test_sink();
    }

    Error err = Error::None;
    if (!serial.open(serial_config(cfg), err)) {
        std::cerr << "status=error reason=" << error_reason(err) << " dev=" << cfg.device << "\n";
        return EXIT_SETUP;
    }

    if (cfg.test_meter) return runner.test_meter();

    return runner.run_processing(cfg.values);
}
