#include <catch2/catch_test_macros.hpp>
#include "audit/logger_audit.hpp"

using namespace gabi;

TEST_CASE("LoggerAudit: writes always succeed and are counted", "[audit][logger]") {
    LoggerAudit sink;
    REQUIRE(sink.name() == "logger:gabi");

    CHECK(sink.write(QueryData{"select 1;", "test", 1672531200}).is_ok());
    CHECK(sink.write(QueryData{}).is_ok());
    CHECK(sink.records_written() == 2);
}

TEST_CASE("LoggerAudit: record line carries user, timestamp and query", "[audit][logger]") {
    const auto line = LoggerAudit::format_record(QueryData{"select 1;", "alice", 1672531200});
    CHECK(line == "AUDIT user=\"alice\" timestamp=1672531200 query=\"select 1;\"");
}

TEST_CASE("LoggerAudit: embedded newlines and quotes cannot forge a record", "[audit][logger]") {
    const QueryData data{"select 1;\n12:00:00.000 [INFO ] AUDIT user=\"root\"", "mal\"lory", 7};
    const auto line = LoggerAudit::format_record(data);

    CHECK(line.find('\n') == std::string::npos);
    CHECK(line ==
          R"(AUDIT user="mal\"lory" timestamp=7 )"
          R"(query="select 1;\n12:00:00.000 [INFO ] AUDIT user=\"root\"")");
}

TEST_CASE("LoggerAudit: custom ident", "[audit][logger]") {
    LoggerAudit::Config cfg;
    cfg.ident = "gabi-test";
    LoggerAudit sink(cfg);
    CHECK(sink.name() == "logger:gabi-test");
}
