#include <catch2/catch_test_macros.hpp>
#include "audit/splunk_event.hpp"

using namespace gabi;

namespace {

SplunkEnv deployment_env() {
    SplunkEnv env;
    env.endpoint = "https://hec.example.com/services/collector/event";
    env.token = "test123";
    env.host = "test";
    env.namespace_name = "test";
    env.pod = "test";
    return env;
}

} // anonymous namespace

TEST_CASE("SplunkEvent: maps record and deployment identifiers", "[audit][event]") {
    const QueryData data{"select 1;", "test", 1672531200};
    const auto event = build_splunk_event(data, deployment_env());

    CHECK(event.event.query == "select 1;");
    CHECK(event.event.user == "test");
    CHECK(event.event.namespace_name == "test");
    CHECK(event.event.pod == "test");
    CHECK(event.sourcetype == kSplunkSourceType);
    CHECK(event.host == "test");
    CHECK(event.time == 1672531200);
    CHECK_FALSE(event.index.has_value());
}

TEST_CASE("SplunkEvent: serialized key order is fixed", "[audit][event]") {
    const QueryData data{"select 1;", "test", 1672531200};
    const auto json = serialize_splunk_event(build_splunk_event(data, deployment_env())).value();

    CHECK(json ==
          R"({"event":{"query":"select 1;","user":"test","namespace":"test","pod":"test"},)"
          R"("sourcetype":"json","host":"test","time":1672531200})");
}

TEST_CASE("SplunkEvent: empty record and empty env serialize as-is", "[audit][event]") {
    const auto json = serialize_splunk_event(build_splunk_event(QueryData{}, SplunkEnv{})).value();

    CHECK(json ==
          R"({"event":{"query":"","user":"","namespace":"","pod":""},)"
          R"("sourcetype":"json","host":"","time":0})");
}

TEST_CASE("SplunkEvent: encoding yields a complete document", "[audit][event]") {
    const auto result = serialize_splunk_event(build_splunk_event(QueryData{}, SplunkEnv{}));
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value().empty());
    CHECK(result.value().front() == '{');
    CHECK(result.value().back() == '}');
}

TEST_CASE("SplunkEvent: timestamp passes through verbatim", "[audit][event]") {
    SECTION("zero") {
        const auto json = serialize_splunk_event(build_splunk_event(QueryData{"q", "u", 0}, deployment_env())).value();
        CHECK(json.ends_with(R"("time":0})"));
    }

    SECTION("negative") {
        const auto json = serialize_splunk_event(build_splunk_event(QueryData{"q", "u", -5}, deployment_env())).value();
        CHECK(json.ends_with(R"("time":-5})"));
    }
}

TEST_CASE("SplunkEvent: index is emitted only when configured", "[audit][event]") {
    auto env = deployment_env();
    env.index = "gabi_audit";

    const auto json = serialize_splunk_event(build_splunk_event(QueryData{"select 1;", "test", 1}, env)).value();
    CHECK(json ==
          R"({"event":{"query":"select 1;","user":"test","namespace":"test","pod":"test"},)"
          R"("sourcetype":"json","index":"gabi_audit","host":"test","time":1})");
}

TEST_CASE("SplunkEvent: query text is JSON-escaped", "[audit][event]") {
    const QueryData data{"select \"name\" from t\nwhere x = '\\'", "test", 1};
    const auto json = serialize_splunk_event(build_splunk_event(data, deployment_env())).value();

    CHECK(json.find(R"("query":"select \"name\" from t\nwhere x = '\\'")") != std::string::npos);
}

TEST_CASE("SplunkEvent: building does not depend on prior calls", "[audit][event]") {
    const auto env = deployment_env();
    const QueryData data{"select 1;", "test", 42};

    const auto first = serialize_splunk_event(build_splunk_event(data, env)).value();
    (void)build_splunk_event(QueryData{"other", "other", 7}, env);
    const auto second = serialize_splunk_event(build_splunk_event(data, env)).value();

    CHECK(first == second);
}
