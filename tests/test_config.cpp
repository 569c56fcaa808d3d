#include <doctest/doctest.h>
#include "kamlink/config.hpp"

#include <cstdio>
#include <fstream>

using namespace kamlink;

TEST_CASE("Defaults match the optical head settings") {
    RunConfig cfg;
    CHECK(cfg.baud == 1200);
    CHECK(cfg.parity == Parity::None);
    CHECK(cfg.stop_bits == 2);
    CHECK(cfg.timeout_ms == 5000);
    CHECK(cfg.retries == 3);
    CHECK(cfg.batch == 8);
    CHECK(cfg.host == "localhost");
    CHECK(cfg.port == 8080);

    std::string why;
    CHECK(validate_config(cfg, why));
}

TEST_CASE("Config file values apply, command line wins over them") {
    ConfigPatch file;
    std::string why;
    REQUIRE(parse_config_json(R"({
        "device": "/dev/ttyUSB1", "host": "domo.lan", "port": 8081,
        "parity": "even", "retries": 5, "values": ["88:60:0", "89:80:1:90"]
    })", file, why));

    ConfigPatch cli;
    cli.host = "10.0.0.2";
    cli.retries = 1;

    RunConfig cfg;
    apply_patch(file, cfg);
    apply_patch(cli, cfg);

    CHECK(cfg.device == "/dev/ttyUSB1");
    CHECK(cfg.host == "10.0.0.2");
    CHECK(cfg.port == 8081);
    CHECK(cfg.parity == Parity::Even);
    CHECK(cfg.retries == 1);
    CHECK(cfg.baud == 1200);
    REQUIRE(cfg.values.size() == 2);
    CHECK(cfg.values[1] == "89:80:1:90");

    CHECK(session_options(cfg).max_retries == 1);
    CHECK(serial_config(cfg).path == "/dev/ttyUSB1");
    CHECK(domoticz_config(cfg).port == 8081);
}

TEST_CASE("Config documents with wrong types are rejected") {
    ConfigPatch p;
    std::string why;
    CHECK_FALSE(parse_config_json("not json", p, why));
    CHECK_FALSE(parse_config_json("[1,2]", p, why));
    CHECK_FALSE(parse_config_json(R"({"port":"8080"})", p, why));
    CHECK(why.find("port") != std::string::npos);
    CHECK_FALSE(parse_config_json(R"({"parity":"mark"})", p, why));
    CHECK_FALSE(parse_config_json(R"({"values":"88:60:0"})", p, why));
    CHECK_FALSE(parse_config_json(R"({"values":[88]})", p, why));
    CHECK_FALSE(parse_config_json(R"({"timeout_ms":5000.5})", p, why));
}

TEST_CASE("Integers outside int range are rejected, not wrapped") {
    ConfigPatch p;
    std::string why;
    CHECK_FALSE(parse_config_json(R"({"port":4294967376})", p, why));
    CHECK(why.find("port") != std::string::npos);
    CHECK_FALSE(parse_config_json(R"({"retries":-3000000000})", p, why));
    CHECK_FALSE(parse_config_json(R"({"batch":18446744073709551615})", p, why));

    REQUIRE(parse_config_json(R"({"port":2147483647,"retries":-1})", p, why));
    CHECK(*p.port == 2147483647);
    CHECK(*p.retries == -1);
}

TEST_CASE("Range checks on the merged configuration") {
    std::string why;
    RunConfig cfg;

    cfg.baud = 115200;
    CHECK_FALSE(validate_config(cfg, why));
    cfg = RunConfig();
    cfg.stop_bits = 3;
    CHECK_FALSE(validate_config(cfg, why));
    cfg = RunConfig();
    cfg.timeout_ms = 0;
    CHECK_FALSE(validate_config(cfg, why));
    cfg = RunConfig();
    cfg.batch = 256;
    CHECK_FALSE(validate_config(cfg, why));
    cfg = RunConfig();
    cfg.retries = -1;
    CHECK_FALSE(validate_config(cfg, why));
}

TEST_CASE("Config file is read from disk") {
    const std::string path = "kamlink_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"device":"/dev/ttyAMA0","batch":4})";
    }
    ConfigPatch p;
    std::string why;
    REQUIRE(load_config_file(path, p, why));
    REQUIRE(p.batch.has_value());
    CHECK(*p.batch == 4);
    std::remove(path.c_str());

    CHECK_FALSE(load_config_file("does/not/exist.json", p, why));
}
