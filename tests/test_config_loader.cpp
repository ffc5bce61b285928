#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace gabi;

TEST_CASE("ConfigLoader: full config", "[config]") {
    const std::string toml = R"(
[splunk]
endpoint = "https://hec.example.com:8088/services/collector/event"
token = "test123"
index = "gabi"
host = "cluster-1"
namespace = "app-sre"
pod = "gabi-0"

[http]
connection_timeout_ms = 2000
read_timeout_ms = 4000
write_timeout_ms = 3000
verify_tls = false
ca_cert_file = "/etc/pki/ca.pem"

[logging]
level = "warn"

[audit]
log_queries = false
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.splunk.endpoint == "https://hec.example.com:8088/services/collector/event");
    CHECK(cfg.splunk.token == "test123");
    CHECK(cfg.splunk.index == "gabi");
    CHECK(cfg.splunk.host == "cluster-1");
    CHECK(cfg.splunk.namespace_name == "app-sre");
    CHECK(cfg.splunk.pod == "gabi-0");
    CHECK(cfg.http.connection_timeout.count() == 2000);
    CHECK(cfg.http.read_timeout.count() == 4000);
    CHECK(cfg.http.write_timeout.count() == 3000);
    CHECK_FALSE(cfg.http.verify_tls);
    CHECK(cfg.http.ca_cert_file == "/etc/pki/ca.pem");
    CHECK(cfg.logging.level == "warn");
    CHECK_FALSE(cfg.audit.log_queries);
}

TEST_CASE("ConfigLoader: defaults for optional sections", "[config]") {
    const std::string toml = R"(
[splunk]
endpoint = "http://localhost:8088/services/collector/event"
token = "t"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.splunk.index.empty());
    CHECK(result.config.http.verify_tls);
    CHECK(result.config.http.connection_timeout == TransportConfig{}.connection_timeout);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.audit.log_queries);
}

TEST_CASE("ConfigLoader: env var expansion", "[config][env]") {
    ::setenv("GABI_TEST_SPLUNK_TOKEN", "s3cret", 1);
    ::unsetenv("GABI_TEST_UNSET_VAR");

    const std::string toml = R"(
[splunk]
endpoint = "http://localhost:8088/services/collector/event"
token = "${GABI_TEST_SPLUNK_TOKEN}"
pod = "pod-${GABI_TEST_UNSET_VAR}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.splunk.token == "s3cret");
    CHECK(result.config.splunk.pod == "pod-");

    ::unsetenv("GABI_TEST_SPLUNK_TOKEN");
}

TEST_CASE("ConfigLoader: unclosed ${ is parse error", "[config][env]") {
    const std::string toml = R"(
[splunk]
endpoint = "http://localhost:8088/"
token = "${UNCLOSED"
)";

    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

TEST_CASE("ConfigLoader: validation", "[config][validation]") {
    SECTION("missing endpoint and token") {
        auto result = ConfigLoader::load_from_string("[splunk]\nhost = \"h\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Config validation failed") != std::string::npos);
        CHECK(result.error_message.find("splunk.endpoint") != std::string::npos);
        CHECK(result.error_message.find("splunk.token") != std::string::npos);
    }

    SECTION("non-positive timeout") {
        const std::string toml = R"(
[splunk]
endpoint = "http://localhost/"
token = "t"

[http]
read_timeout_ms = 0
)";
        auto result = ConfigLoader::load_from_string(toml);
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("http.read_timeout_ms") != std::string::npos);
    }

    SECTION("unknown log level") {
        const std::string toml = R"(
[splunk]
endpoint = "http://localhost/"
token = "t"

[logging]
level = "debug"
)";
        auto result = ConfigLoader::load_from_string(toml);
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("logging.level") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: invalid TOML", "[config]") {
    auto result = ConfigLoader::load_from_string("[splunk\nendpoint = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    const std::string path = "/tmp/test_gabi_audit_config.toml";
    {
        std::ofstream out(path);
        out << "[splunk]\nendpoint = \"http://localhost:8088/\"\ntoken = \"file-token\"\n";
    }

    auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.splunk.token == "file-token");
    std::filesystem::remove(path);

    auto missing = ConfigLoader::load_from_file("/tmp/does_not_exist_gabi_audit.toml");
    CHECK_FALSE(missing.success);
    CHECK(missing.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigLoader: load from environment", "[config][env]") {
    ::setenv("SPLUNK_ENDPOINT", "http://localhost:8088/services/collector/event", 1);
    ::setenv("SPLUNK_TOKEN", "env-token", 1);
    ::setenv("SPLUNK_INDEX", "gabi", 1);
    ::setenv("HOST", "cluster-1", 1);
    ::setenv("NAMESPACE", "app-sre", 1);
    ::setenv("POD_NAME", "gabi-0", 1);

    auto result = ConfigLoader::load_from_env();
    REQUIRE(result.success);
    CHECK(result.config.splunk.endpoint == "http://localhost:8088/services/collector/event");
    CHECK(result.config.splunk.token == "env-token");
    CHECK(result.config.splunk.index == "gabi");
    CHECK(result.config.splunk.host == "cluster-1");
    CHECK(result.config.splunk.namespace_name == "app-sre");
    CHECK(result.config.splunk.pod == "gabi-0");

    ::unsetenv("SPLUNK_TOKEN");
    auto missing_token = ConfigLoader::load_from_env();
    CHECK_FALSE(missing_token.success);
    CHECK(missing_token.error_message.find("splunk.token") != std::string::npos);

    for (const char* name : {"SPLUNK_ENDPOINT", "SPLUNK_INDEX", "HOST", "NAMESPACE", "POD_NAME"}) {
        ::unsetenv(name);
    }
}
