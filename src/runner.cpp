// ============================================================================
// runner.cpp — implementation for runner.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file runner.cpp
 */

#include "kamlink/runner.hpp"
#include "kamlink/domoticz_client.hpp"   // format_svalue for report lines
#include "kamlink/log.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <utility>

namespace kamlink {

static std::string local_stamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

std::size_t RunSummary::written() const {
    return static_cast<std::size_t>(std::count_if(outputs.begin(), outputs.end(),
                                                  [](const OutputStatus& o) { return o.written; }));
}

std::size_t RunSummary::failed() const {
    return outputs.size() - written();
}

int exit_code_for(const RunSummary& s) {
    if (s.outputs.empty())  return EXIT_USAGE;
    if (s.failed() == 0)    return EXIT_OK;
    if (s.written() == 0)   return EXIT_ALL_FAILED;
    return EXIT_PARTIAL;
}

Runner::Runner(MeterSession& session, ValueStore& store, const CommandRegistry& registry,
               std::ostream& out)
    : session_(session), store_(store), registry_(registry), out_(out), clock_(local_stamp) {}

void Runner::header(const std::string& stamp) {
    out_ << std::string(87, '=') << '\n'
         << "Kamstrup Multical 402 serial optical data received: " << stamp << '\n'
         << "Meter vendor/type: Kamstrup M402\n"
         << std::string(87, '-') << '\n';
}

void Runner::footer(const std::string& stamp) {
    out_ << std::string(87, '-') << '\n'
         << "End data received: " << stamp << '\n'
         << std::string(87, '=') << '\n';
}

// ---------------------------------------------------------------------------
// Processing run
// ---------------------------------------------------------------------------

static std::string failed_output(Error err, const std::string& request) {
    return std::string("reason=") + error_reason(err) +
           " class=" + error_class_name(error_class(err)) + " request=" + request;
}

struct PendingRequest {
    ProcessingRequest req;
    std::size_t       slot;   // index into RunSummary::outputs
};

int Runner::run_processing(const std::vector<std::string>& requests, RunSummary* summary) {
    RunSummary sum;
    std::vector<PendingRequest> pending;

    // 1. parse
    for (const auto& text : requests) {
        OutputStatus st;
        st.text = text;
        ProcessingRequest req;
        Error err = Error::None;
        if (!parse_request(text, req, err)) {
            st.err = err;
            log_error(failed_output(err, text));
        } else {
            st.target_device_id = req.target_device_id;
            pending.push_back({req, sum.outputs.size()});
        }
        sum.outputs.push_back(st);
    }

    if (pending.empty()) {
        log_error("reason=no_valid_request count=" + std::to_string(requests.size()));
        if (summary) *summary = sum;
        return EXIT_USAGE;
    }

    // 2. distinct ids, first appearance; unknown ones never reach the meter
    std::vector<int> order;
    std::vector<int> to_query;
    for (const auto& p : pending) {
        const int id = p.req.command_id;
        if (std::find(order.begin(), order.end(), id) != order.end()) continue;
        order.push_back(id);
        if (registry_.contains(id)) {
            to_query.push_back(id);
        } else {
            log_warn("reason=unknown_command command=" + std::to_string(id));
        }
    }

    const std::string stamp = clock_();
    ReadingCatalog readings;
    if (!to_query.empty()) {
        Error err = Error::None;
        if (!session_.query(to_query, readings, err)) {
            log_error(std::string("reason=") + error_reason(err) + " op=query");
            for (auto& p : pending) sum.outputs[p.slot].err = err;
            if (summary) *summary = sum;
            return EXIT_METER_UNREACHABLE;
        }
    }

    header(stamp);

    // 3. per command id: reading line, then its requests
    for (int id : order) {
        const Reading* r = readings.find(id);
        if (r) out_ << format_reading(*r, registry_) << '\n';

        for (auto& p : pending) {
            if (p.req.command_id != id) continue;
            OutputStatus& st = sum.outputs[p.slot];

            if (!r) {
                st.err = Error::UnknownCommand;
                log_error(failed_output(st.err, st.text));
                continue;
            }

            ProcessingResult res;
            Error err = Error::None;
            if (!ValueProcessor::process(p.req, *r, store_, res, err)) {
                st.err = err;
                log_error(failed_output(err, st.text));
                continue;
            }

            out_ << "  + Mode " << static_cast<int>(p.req.mode) << " (" << mode_name(p.req.mode)
                 << "): Submit value " << domoticz::format_svalue(res.value)
                 << " to '" << device_label(res.target_device_id)
                 << "' (idx: " << res.target_device_id << ")\n";

            if (!store_.set_value(res.target_device_id, res.value, err)) {
                st.err = err;
                log_error(failed_output(err, st.text));
                continue;
            }
            st.written = true;
            st.value   = res.value;
        }
    }

    footer(stamp);

    const int code = exit_code_for(sum);
    log_info("op=run written=" + std::to_string(sum.written()) +
             " failed=" + std::to_string(sum.failed()) + " exit=" + std::to_string(code));
    if (summary) *summary = std::move(sum);
    return code;
}

// Display name of a sink device; "idx:<n>" when the sink cannot name it.
std::string Runner::device_label(int device_id) {
    DeviceInfo d;
    Error err = Error::None;
    if (store_.get_device(device_id, d, err) && !d.name.empty()) return d.name;
    log_debug(std::string("op=device_label device=") + std::to_string(device_id) +
              " reason=" + error_reason(err == Error::None ? Error::DeviceNotFound : err));
    return "idx:" + std::to_string(device_id);
}

// ---------------------------------------------------------------------------
// Diagnostic modes
// ---------------------------------------------------------------------------

int Runner::test_meter() {
    ReadingCatalog readings;
    Error err = Error::None;
    if (!session_.query_all(readings, err)) {
        log_error(std::string("reason=") + error_reason(err) + " op=test_meter");
        return EXIT_METER_UNREACHABLE;
    }

    const std::string stamp = clock_();
    header(stamp);
    for (const auto& d : registry_.all()) {
        const Reading* r = readings.find(d.id);
        if (r) out_ << format_reading(*r, registry_) << '\n';
    }
    footer(stamp);
    return EXIT_OK;
}

int Runner::test_sink() {
    std::vector<DeviceInfo> devices;
    Error err = Error::None;
    if (!store_.list_devices(devices, err)) {
        log_error(std::string("reason=") + error_reason(err) + " op=test_sink");
        return EXIT_SETUP;
    }

    for (const auto& d : devices) {
        char line[512];
        std::snprintf(line, sizeof(line), "idx: %5d, Name: %-60s, Value: ", d.id, d.name.c_str());
        out_ << line << d.data << '\n';
    }
    out_ << "\n=== Found " << devices.size() << " devices ===\n";
    return EXIT_OK;
}

} // namespace kamlink
