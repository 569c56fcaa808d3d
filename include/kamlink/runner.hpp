#pragma once
/**
 * @page kl-runner KamLink Runner
 * @file runner.hpp
 * @brief One invocation end to end: parse requests, poll the meter once, process, write, report.
 *
 * @details
 * FLOW (run_processing)
 * ---------------------
 *   1. parse_request() on every string; bad ones are logged and counted as failed
 *      outputs, the rest continue.
 *   2. Distinct command ids of the good requests (first-appearance order) that the
 *      registry knows are queried in a single MeterSession::query(). Ids the
 *      registry does not know fail their outputs with UnknownCommand without
 *      touching the meter.
 *   3. Per command id: one reading line, then for each request on that id
 *      ValueProcessor::process(), a "Submit value" line naming the target
 *      device (ValueStore::get_device(), "idx:<n>" if it has no name), and
 *      ValueStore::set_value().
 *   4. Header and footer with a timestamp frame the report.
 *
 * Report text goes to the injected std::ostream; diagnostics go through log.hpp.
 *
 * EXIT CODES
 * ----------
 *   0  every output written
 *   1  setup failure (device, config, sink unreachable in --test-sink)
 *   2  usage error (nothing to do, no valid request)
 *   3  meter unreachable
 *   4  partial: at least one output written and at least one failed
 *   5  every output failed
 */

#include "kamlink/command_registry.hpp"
#include "kamlink/meter_session.hpp"
#include "kamlink/value_processor.hpp"
#include "kamlink/value_store.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace kamlink {

enum ExitCode : int {
    EXIT_OK                = 0,
    EXIT_SETUP             = 1,
    EXIT_USAGE             = 2,
    EXIT_METER_UNREACHABLE = 3,
    EXIT_PARTIAL           = 4,
    EXIT_ALL_FAILED        = 5
};

struct OutputStatus {
    std::string text;              ///< request as given on the command line
    int         target_device_id = -1;
    bool        written = false;
    Error       err     = Error::None;
    double      value   = 0.0;
};

struct RunSummary {
    std::vector<OutputStatus> outputs;
    std::size_t written() const;
    std::size_t failed() const;
};

/// Exit code for a finished run where the meter answered.
int exit_code_for(const RunSummary& s);

class Runner {
public:
    Runner(MeterSession& session, ValueStore& store, const CommandRegistry& registry,
           std::ostream& out);

    /// Replace the report timestamp source ("YYYY-MM-DD HH:MM:SS" local time by default).
    void set_clock(std::function<std::string()> clock) { clock_ = std::move(clock); }

    int run_processing(const std::vector<std::string>& requests, RunSummary* summary = nullptr);

    /// Poll every register and print one line each.
    int test_meter();

    /// List sink devices.
    int test_sink();

private:
    void header(const std::string& stamp);
    void footer(const std::string& stamp);
    std::string device_label(int device_id);

    MeterSession&          session_;
    ValueStore&            store_;
    const CommandRegistry& registry_;
    std::ostream&          out_;
    std::function<std::string()> clock_;
};

} // namespace kamlink
