#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace gabi {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string{};
}

// ---- Section extractors ----------------------------------------------------

SplunkEnv extract_splunk(const toml::table& root) {
    SplunkEnv env;
    const auto* splunk = root["splunk"].as_table();
    if (!splunk) return env;
    const auto& s = *splunk;

    env.endpoint = s["endpoint"].value_or(""s);
    env.token = s["token"].value_or(""s);
    env.index = s["index"].value_or(""s);
    env.host = s["host"].value_or(""s);
    env.namespace_name = s["namespace"].value_or(""s);
    env.pod = s["pod"].value_or(""s);
    return env;
}

TransportConfig extract_http(const toml::table& root) {
    TransportConfig cfg;
    const auto* http = root["http"].as_table();
    if (!http) return cfg;
    const auto& h = *http;

    cfg.connection_timeout = std::chrono::milliseconds(
        h["connection_timeout_ms"].value_or(int64_t{cfg.connection_timeout.count()}));
    cfg.read_timeout = std::chrono::milliseconds(
        h["read_timeout_ms"].value_or(int64_t{cfg.read_timeout.count()}));
    cfg.write_timeout = std::chrono::milliseconds(
        h["write_timeout_ms"].value_or(int64_t{cfg.write_timeout.count()}));
    cfg.verify_tls = h["verify_tls"].value_or(cfg.verify_tls);
    cfg.ca_cert_file = h["ca_cert_file"].value_or(""s);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or(cfg.level);
    }
    return cfg;
}

AuditOutputConfig extract_audit(const toml::table& root) {
    AuditOutputConfig cfg;
    if (const auto* audit = root["audit"].as_table()) {
        cfg.log_queries = (*audit)["log_queries"].value_or(cfg.log_queries);
    }
    return cfg;
}

AuditServiceConfig extract_all_sections(const toml::table& tbl) {
    AuditServiceConfig config;
    config.splunk = extract_splunk(tbl);
    config.http = extract_http(tbl);
    config.logging = extract_logging(tbl);
    config.audit = extract_audit(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AuditServiceConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_env() {
    AuditServiceConfig config;
    config.splunk.endpoint = env_or_empty("SPLUNK_ENDPOINT");
    config.splunk.token = env_or_empty("SPLUNK_TOKEN");
    config.splunk.index = env_or_empty("SPLUNK_INDEX");
    config.splunk.host = env_or_empty("HOST");
    config.splunk.namespace_name = env_or_empty("NAMESPACE");
    config.splunk.pod = env_or_empty("POD_NAME");
    return validate_and_return(std::move(config));
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AuditServiceConfig& config) {
    std::vector<std::string> errors;

    if (config.splunk.endpoint.empty()) {
        errors.emplace_back("splunk.endpoint is required");
    }
    if (config.splunk.token.empty()) {
        errors.emplace_back("splunk.token is required");
    }

    if (config.http.connection_timeout.count() <= 0) {
        errors.push_back(std::format("http.connection_timeout_ms must be positive, got {}",
                                     config.http.connection_timeout.count()));
    }
    if (config.http.read_timeout.count() <= 0) {
        errors.push_back(std::format("http.read_timeout_ms must be positive, got {}",
                                     config.http.read_timeout.count()));
    }
    if (config.http.write_timeout.count() <= 0) {
        errors.push_back(std::format("http.write_timeout_ms must be positive, got {}",
                                     config.http.write_timeout.count()));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace gabi
