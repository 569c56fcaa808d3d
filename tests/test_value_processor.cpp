#include <doctest/doctest.h>
#include "kamlink/value_processor.hpp"
#include "fakes.hpp"

using namespace kamlink;
using namespace kamlink_test;

static Reading reading_of(int id, int64_t mag, int exp) {
    Reading r;
    r.command_id = id;
    r.raw_magnitude = mag;
    r.decimal_exponent = exp;
    return r;
}

static ProcessingRequest request(int target, int cmd, Mode m, std::optional<int> cmp = std::nullopt) {
    ProcessingRequest q;
    q.target_device_id = target;
    q.command_id = cmd;
    q.mode = m;
    q.comparison_device_id = cmp;
    return q;
}

TEST_CASE("Request strings: three or four integer fields, 0x accepted") {
    ProcessingRequest q;
    Error err = Error::None;

    REQUIRE(parse_request("89:80:0", q, err));
    CHECK(q.target_device_id == 89);
    CHECK(q.command_id == 80);
    CHECK(q.mode == Mode::Overwrite);
    CHECK_FALSE(q.comparison_device_id.has_value());

    REQUIRE(parse_request("89:0x50:1:90", q, err));
    CHECK(q.command_id == 0x50);
    CHECK(q.mode == Mode::Subtract);
    REQUIRE(q.comparison_device_id.has_value());
    CHECK(*q.comparison_device_id == 90);
    CHECK(q.to_string() == "89:80:1:90");

    REQUIRE(parse_request("91:60:2:92", q, err));
    CHECK(q.mode == Mode::Add);
}

TEST_CASE("Malformed request strings are InvalidRequest") {
    const char* bad[] = {
        "", "89", "89:80", "89:80:1:90:5", "a:80:0", "89:80:x", "89:80:3",
        "89:80:-1", "89::0", "89:80:0:", "-5:80:0", "89:80:0:90", "89:80:1", "89:80:2",
        " 89:80:0", "+89:80:0", "89:+80:0", "89:80: 1:90", "89:80:0 ", "99999999999:80:0"
    };
    for (const char* s : bad) {
        ProcessingRequest q;
        Error err = Error::None;
        CAPTURE(s);
        CHECK_FALSE(parse_request(s, q, err));
        CHECK(err == Error::InvalidRequest);
    }
}

TEST_CASE("Overwrite returns the reading without fetching anything") {
    FakeStore store;
    ProcessingResult res;
    Error err = Error::None;

    REQUIRE(ValueProcessor::process(request(89, 80, Mode::Overwrite), reading_of(80, 55, -1), store, res, err));
    CHECK(res.target_device_id == 89);
    CHECK(res.value == doctest::Approx(5.5));
    CHECK(store.reads == 0);

    // same inputs, same output
    ProcessingResult again;
    REQUIRE(ValueProcessor::process(request(89, 80, Mode::Overwrite), reading_of(80, 55, -1), store, again, err));
    CHECK(again.value == res.value);
}

TEST_CASE("Subtract takes the comparison device away from the reading") {
    FakeStore store;
    store.values[90] = 2.0;
    ProcessingResult res;
    Error err = Error::None;

    REQUIRE(ValueProcessor::process(request(89, 80, Mode::Subtract, 90), reading_of(80, 55, -1), store, res, err));
    CHECK(res.value == doctest::Approx(3.5));
}

TEST_CASE("Add accumulates onto the stored target value") {
    FakeStore store;
    store.values[91] = 100.0;
    store.values[92] = 40.0;
    ProcessingResult res;
    Error err = Error::None;

    REQUIRE(ValueProcessor::process(request(91, 60, Mode::Add, 92), reading_of(60, 55, 0), store, res, err));
    CHECK(res.value == doctest::Approx(115.0));
    CHECK(store.reads == 2);
}

TEST_CASE("Missing stored value is ValueUnavailable") {
    FakeStore store;
    ProcessingResult res;
    Error err = Error::None;

    CHECK_FALSE(ValueProcessor::process(request(89, 80, Mode::Subtract, 90), reading_of(80, 55, -1), store, res, err));
    CHECK(err == Error::ValueUnavailable);

    store.values[92] = 1.0;          // comparison present, target missing
    err = Error::None;
    CHECK_FALSE(ValueProcessor::process(request(91, 60, Mode::Add, 92), reading_of(60, 1, 0), store, res, err));
    CHECK(err == Error::ValueUnavailable);

    store.offline = true;
    err = Error::None;
    CHECK_FALSE(ValueProcessor::process(request(89, 80, Mode::Subtract, 92), reading_of(80, 1, 0), store, res, err));
    CHECK(err == Error::ValueUnavailable);
}

TEST_CASE("Mode and comparison id must agree before anything is fetched") {
    FakeStore store;
    store.values[90] = 1.0;
    ProcessingResult res;
    Error err = Error::None;

    CHECK_FALSE(ValueProcessor::process(request(89, 80, Mode::Overwrite, 90), reading_of(80, 1, 0), store, res, err));
    CHECK(err == Error::InvalidRequest);

    err = Error::None;
    CHECK_FALSE(ValueProcessor::process(request(89, 80, Mode::Subtract), reading_of(80, 1, 0), store, res, err));
    CHECK(err == Error::InvalidRequest);

    err = Error::None;
    CHECK_FALSE(ValueProcessor::process(request(89, 80, Mode::Add), reading_of(80, 1, 0), store, res, err));
    CHECK(err == Error::InvalidRequest);
    CHECK(store.reads == 0);
}

TEST_CASE("A plain callback can stand in for the store") {
    FetchValue fetch = [](int id, double& v, Error& e) {
        if (id != 7) { e = Error::DeviceNotFound; return false; }
        v = 10.0;
        return true;
    };
    ProcessingResult res;
    Error err = Error::None;
    REQUIRE(ValueProcessor::process(request(1, 60, Mode::Subtract, 7), reading_of(60, 125, -1), fetch, res, err));
    CHECK(res.value == doctest::Approx(2.5));
}
