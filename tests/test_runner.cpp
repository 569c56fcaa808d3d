#include <doctest/doctest.h>
#include "kamlink/command_registry.hpp"
#include "kamlink/log.hpp"
#include "kamlink/meter_session.hpp"
#include "kamlink/runner.hpp"
#include "fakes.hpp"

#include <sstream>

using namespace kamlink;
using namespace kamlink_test;

using Bytes = std::vector<uint8_t>;

static const Bytes REPLY_80 = {0x40, 0x3F, 0x10, 0x00, 0x50, 0x15, 0x01, 0x41, 0x37, 0x55, 0xCC, 0x0D};

// Meter, store and runner wired together the way main() does it.
struct Bench {
    FakeStream line;
    FakeStore store;
    std::ostringstream out;
    MeterSession session;
    Runner runner;

    Bench()
        : session(line, CommandRegistry::multical402(), options()),
          runner(session, store, CommandRegistry::multical402(), out) {
        runner.set_clock([] { return std::string("2024-01-01 12:00:00"); });
    }

    static SessionOptions options() {
        SessionOptions o;
        o.timeout_ms = 10;
        o.max_retries = 1;
        return o;
    }
};

TEST_CASE("Power minus snapshot device is written to the target") {
    Bench b;
    b.line.reply(REPLY_80);
    b.store.values[90] = 2.0;
    b.store.names[89] = "Heat Power";

    RunSummary sum;
    CHECK(b.runner.run_processing({"89:80:1:90"}, &sum) == EXIT_OK);
    REQUIRE(b.store.writes.size() == 1);
    CHECK(b.store.writes[0].first == 89);
    CHECK(b.store.writes[0].second == doctest::Approx(3.5));
    CHECK(b.line.writes.size() == 1);

    REQUIRE(sum.outputs.size() == 1);
    CHECK(sum.outputs[0].written);

    const std::string text = b.out.str();
    CHECK(text.find("Kamstrup Multical 402 serial optical data received: 2024-01-01 12:00:00") != std::string::npos);
    CHECK(text.find("Meter vendor/type: Kamstrup M402") != std::string::npos);
    CHECK(text.find("CommandNr   80: Power") != std::string::npos);
    CHECK(text.find("  + Mode 1 (subtract): Submit value 3.50 to 'Heat Power' (idx: 89)") != std::string::npos);
    CHECK(text.find("End data received: 2024-01-01 12:00:00") != std::string::npos);
}

TEST_CASE("Submit line falls back to the idx when the sink cannot name the device") {
    Bench b;
    b.line.reply(REPLY_80);

    CHECK(b.runner.run_processing({"88:80:0"}) == EXIT_OK);
    CHECK(b.out.str().find("Submit value 5.50 to 'idx:88' (idx: 88)") != std::string::npos);

    Bench blank;
    blank.line.reply(REPLY_80);
    blank.store.names[88] = "";
    CHECK(blank.runner.run_processing({"88:80:0"}) == EXIT_OK);
    CHECK(blank.out.str().find("to 'idx:88' (idx: 88)") != std::string::npos);
}

TEST_CASE("One register feeding several outputs is read once") {
    Bench b;
    b.line.reply(REPLY_80);
    b.store.values[90] = 2.0;
    b.store.values[91] = 10.0;

    CHECK(b.runner.run_processing({"88:80:0", "89:80:1:90", "91:0x50:2:90"}) == EXIT_OK);
    CHECK(b.line.writes.size() == 1);
    REQUIRE(b.store.writes.size() == 3);
    CHECK(b.store.values[88] == doctest::Approx(5.5));
    CHECK(b.store.values[89] == doctest::Approx(3.5));
    CHECK(b.store.values[91] == doctest::Approx(13.5));
}

TEST_CASE("Silent meter ends the run with no writes") {
    Bench b;
    b.store.values[90] = 2.0;

    CHECK(b.runner.run_processing({"89:80:1:90"}) == EXIT_METER_UNREACHABLE);
    CHECK(b.store.writes.empty());
    CHECK(b.line.writes.size() == 2);
}

TEST_CASE("Bad request strings are skipped, the rest are written") {
    Bench b;
    b.line.reply(REPLY_80);
    std::ostringstream log;
    set_log_stream(&log);

    RunSummary sum;
    CHECK(b.runner.run_processing({"89:80", "88:80:0"}, &sum) == EXIT_PARTIAL);
    set_log_stream(nullptr);

    REQUIRE(sum.outputs.size() == 2);
    CHECK(sum.outputs[0].err == Error::InvalidRequest);
    CHECK(sum.outputs[1].written);
    CHECK(log.str().find("status=error reason=invalid_request class=request request=89:80") != std::string::npos);
}

TEST_CASE("Nothing valid to do is a usage error and the meter is not asked") {
    Bench b;
    CHECK(b.runner.run_processing({"nonsense", "1:2:3"}) == EXIT_USAGE);
    CHECK(b.line.writes.empty());
}

TEST_CASE("Unknown register fails only its own output") {
    Bench b;
    b.line.reply(REPLY_80);

    RunSummary sum;
    CHECK(b.runner.run_processing({"88:9999:0", "89:80:0"}, &sum) == EXIT_PARTIAL);
    CHECK(sum.outputs[0].err == Error::UnknownCommand);
    CHECK(sum.outputs[1].written);
    REQUIRE(b.line.writes.size() == 1);
    CHECK(b.line.writes[0] == Bytes{0x80, 0x3F, 0x10, 0x01, 0x00, 0x50, 0x1F, 0x75, 0x0D});
}

TEST_CASE("Every output failing gives its own exit code") {
    Bench b;
    b.line.reply(REPLY_80);
    b.store.reject_writes.insert(88);

    RunSummary sum;
    CHECK(b.runner.run_processing({"88:80:0", "89:80:1:90"}, &sum) == EXIT_ALL_FAILED);
    CHECK(sum.outputs[0].err == Error::SinkFailure);
    CHECK(sum.outputs[1].err == Error::ValueUnavailable);
}

TEST_CASE("Sink listing prints one padded line per device") {
    Bench b;
    b.store.values[7] = 1.0;

    CHECK(b.runner.test_sink() == EXIT_OK);
    const std::string text = b.out.str();
    CHECK(text.find("idx:     7, Name: Device 7") != std::string::npos);
    CHECK(text.find("=== Found 1 devices ===") != std::string::npos);
    CHECK(b.line.writes.empty());

    Bench down;
    down.store.offline = true;
    CHECK(down.runner.test_sink() == EXIT_SETUP);
}

TEST_CASE("Meter listing prints every register") {
    Bench b;
    const auto& reg = CommandRegistry::multical402();
    std::vector<kmp::RawField> all;
    for (int id : reg.ids()) all.push_back(field(id, 1, 0, 0));
    for (std::size_t i = 0; i < all.size(); i += 8) {
        std::size_t stop = i + 8 < all.size() ? i + 8 : all.size();
        b.line.reply(meter_reply(std::vector<kmp::RawField>(all.begin() + i, all.begin() + stop)));
    }

    CHECK(b.runner.test_meter() == EXIT_OK);
    const std::string text = b.out.str();
    CHECK(text.find("CommandNr   60: Heat Energy (E1)") != std::string::npos);
    CHECK(text.find("CommandNr 1004: HourCounter") != std::string::npos);
}

TEST_CASE("Exit code summary") {
    RunSummary s;
    CHECK(exit_code_for(s) == EXIT_USAGE);
    OutputStatus ok;  ok.written = true;
    OutputStatus bad; bad.err = Error::SinkFailure;
    s.outputs = {ok};
    CHECK(exit_code_for(s) == EXIT_OK);
    s.outputs = {ok, bad};
    CHECK(exit_code_for(s) == EXIT_PARTIAL);
    s.outputs = {bad};
    CHECK(exit_code_for(s) == EXIT_ALL_FAILED);
}
