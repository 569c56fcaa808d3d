#include <doctest/doctest.h>
#include "kamlink/command_registry.hpp"
#include "kamlink/meter_session.hpp"
#include "fakes.hpp"

#include <algorithm>

using namespace kamlink;
using namespace kamlink_test;

using Bytes = std::vector<uint8_t>;

static const Bytes REQUEST_80 = {0x80, 0x3F, 0x10, 0x01, 0x00, 0x50, 0x1F, 0x75, 0x0D};
static const Bytes REPLY_80   = {0x40, 0x3F, 0x10, 0x00, 0x50, 0x15, 0x01, 0x41, 0x37, 0x55, 0xCC, 0x0D};

static SessionOptions fast(int retries = 3, std::size_t batch = 8) {
    SessionOptions o;
    o.timeout_ms  = 10;
    o.max_retries = retries;
    o.max_batch   = batch;
    return o;
}

TEST_CASE("Single register: one request frame, reading in kW") {
    FakeStream line;
    line.reply(REPLY_80);
    MeterSession s(line, CommandRegistry::multical402(), fast());

    ReadingCatalog cat;
    Error err = Error::None;
    REQUIRE(s.query({80}, cat, err));
    REQUIRE(line.writes.size() == 1);
    CHECK(line.writes[0] == REQUEST_80);
    CHECK(line.discards == 1);

    const Reading* r = cat.find(80);
    REQUIRE(r != nullptr);
    CHECK(r->value() == doctest::Approx(5.5));
    CHECK(r->unit == "kW");
}

TEST_CASE("Echo of the request ahead of the reply is skipped") {
    FakeStream line;
    Bytes echoed = REQUEST_80;
    echoed.insert(echoed.end(), REPLY_80.begin(), REPLY_80.end());
    line.reply(echoed);
    MeterSession s(line, CommandRegistry::multical402(), fast());

    ReadingCatalog cat;
    Error err = Error::None;
    REQUIRE(s.query({80}, cat, err));
    CHECK(cat.contains(80));
}

TEST_CASE("Silence on every attempt: MeterUnreachable after 1 + retries frames") {
    FakeStream line;
    MeterSession s(line, CommandRegistry::multical402(), fast(3));

    ReadingCatalog cat;
    Reading stale; stale.command_id = 1;
    cat.add(stale);

    Error err = Error::None;
    CHECK_FALSE(s.query({80}, cat, err));
    CHECK(err == Error::MeterUnreachable);
    CHECK(s.frames_sent() == 4);
    CHECK(line.writes.size() == 4);
    CHECK(cat.size() == 1);          // untouched on failure
}

TEST_CASE("Corrupted reply is retried and the next good one is used") {
    FakeStream line;
    Bytes bad = REPLY_80;
    bad[8] ^= 0x01;
    line.reply(bad);
    line.silence();
    line.reply(REPLY_80);
    MeterSession s(line, CommandRegistry::multical402(), fast(3));

    ReadingCatalog cat;
    Error err = Error::None;
    REQUIRE(s.query({80}, cat, err));
    CHECK(s.frames_sent() == 3);
    CHECK(cat.find(80)->raw_magnitude == 55);
}

TEST_CASE("Consecutive CRC errors use up the retry budget, then MeterUnreachable") {
    FakeStream line;
    Bytes bad_crc = REPLY_80;
    bad_crc[bad_crc.size() - 2] = 0xCD;          // second CRC byte, 0xCC on the wire
    for (int i = 0; i < 10; ++i) line.reply(bad_crc);
    MeterSession s(line, CommandRegistry::multical402(), fast(2));

    ReadingCatalog cat;
    Error err = Error::None;
    CHECK_FALSE(s.query({80}, cat, err));
    CHECK(err == Error::MeterUnreachable);
    CHECK(s.frames_sent() == 3);
    CHECK(line.replies.size() == 7);
    CHECK(cat.empty());
}

TEST_CASE("Read error on the stream is not retried") {
    FakeStream line;
    line.fail_read = true;
    MeterSession s(line, CommandRegistry::multical402(), fast(3));

    ReadingCatalog cat;
    Error err = Error::None;
    CHECK_FALSE(s.query({80}, cat, err));
    CHECK(err == Error::MeterUnreachable);
    CHECK(s.frames_sent() == 1);
}

TEST_CASE("Zero retries means exactly one attempt") {
    FakeStream line;
    line.silence();
    line.reply(REPLY_80);
    MeterSession s(line, CommandRegistry::multical402(), fast(0));

    ReadingCatalog cat;
    Error err = Error::None;
    CHECK_FALSE(s.query({80}, cat, err));
    CHECK(err == Error::MeterUnreachable);
    CHECK(s.frames_sent() == 1);
}

TEST_CASE("Reply for a different register is not accepted") {
    FakeStream line;
    line.reply(meter_reply({field(60, 1234, -2, 2)}));
    MeterSession s(line, CommandRegistry::multical402(), fast(0));

    ReadingCatalog cat;
    Error err = Error::None;
    CHECK_FALSE(s.query({80}, cat, err));
    CHECK(err == Error::MeterUnreachable);
}

TEST_CASE("Duplicate ids are asked once, readings follow the reply order") {
    FakeStream line;
    line.reply(meter_reply({field(68, 123456, -3, 40), field(60, 1234, -2, 2)}));
    MeterSession s(line, CommandRegistry::multical402(), fast());

    ReadingCatalog cat;
    Error err = Error::None;
    REQUIRE(s.query({60, 68, 60}, cat, err));
    REQUIRE(line.writes.size() == 1);
    CHECK(line.writes[0] == Bytes{0x80, 0x3F, 0x10, 0x02, 0x00, 0x3C, 0x00, 0x44, 0x35, 0xE7, 0x0D});
    REQUIRE(cat.size() == 2);
    CHECK(cat.begin()->command_id == 68);
    CHECK(cat.find(68)->value() == doctest::Approx(123.456));
}

TEST_CASE("Batch size splits the request into several frames") {
    FakeStream line;
    line.reply(meter_reply({field(60, 1, 0, 2), field(80, 2, 0, 21)}));
    line.reply(meter_reply({field(0x56, 3, 0, 37)}));
    MeterSession s(line, CommandRegistry::multical402(), fast(3, 2));

    ReadingCatalog cat;
    Error err = Error::None;
    REQUIRE(s.query({60, 80, 0x56}, cat, err));
    CHECK(line.writes.size() == 2);
    CHECK(cat.size() == 3);
}

TEST_CASE("Empty id list and out-of-range ids fail without touching the line") {
    FakeStream line;
    MeterSession s(line, CommandRegistry::multical402(), fast());

    ReadingCatalog cat;
    Error err = Error::None;
    CHECK_FALSE(s.query({}, cat, err));
    CHECK(err == Error::InvalidCommandId);

    err = Error::None;
    CHECK_FALSE(s.query({0x10000}, cat, err));
    CHECK(err == Error::InvalidCommandId);
    CHECK(line.writes.empty());
}

TEST_CASE("Write failure is not retried") {
    FakeStream line;
    line.fail_write = true;
    MeterSession s(line, CommandRegistry::multical402(), fast(3));

    ReadingCatalog cat;
    Error err = Error::None;
    CHECK_FALSE(s.query({80}, cat, err));
    CHECK(err == Error::MeterUnreachable);
    CHECK(s.frames_sent() == 1);
}

TEST_CASE("query_all asks for every register in the table") {
    const auto& reg = CommandRegistry::multical402();
    FakeStream line;
    std::vector<kmp::RawField> all;
    for (int id : reg.ids()) all.push_back(field(id, id, 0, 0));
    for (std::size_t i = 0; i < all.size(); i += 8) {
        std::vector<kmp::RawField> part(all.begin() + i, all.begin() + std::min(all.size(), i + 8));
        line.reply(meter_reply(part));
    }
    MeterSession s(line, reg, fast());

    ReadingCatalog cat;
    Error err = Error::None;
    REQUIRE(s.query_all(cat, err));
    CHECK(cat.size() == reg.all().size());
    CHECK(line.writes.size() == 4);
}
