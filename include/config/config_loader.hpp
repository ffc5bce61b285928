#pragma once

#include "config/splunk_env.hpp"
#include "http/http_client.hpp"

#include <string>
#include <utility>
#include <vector>

namespace gabi {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";   // info | warn | error
};

struct AuditOutputConfig {
    bool log_queries = true;      // Also record queries through LoggerAudit
};

struct AuditServiceConfig {
    SplunkEnv splunk;
    TransportConfig http;
    LoggingConfig logging;
    AuditOutputConfig audit;
};

// ============================================================================
// Config Loader
// ============================================================================

/**
 * @brief Loads AuditServiceConfig from TOML or the process environment
 *
 * TOML layout:
 *   [splunk]   endpoint, token, index, host, namespace, pod
 *   [http]     connection_timeout_ms, read_timeout_ms, write_timeout_ms,
 *              verify_tls, ca_cert_file
 *   [logging]  level
 *   [audit]    log_queries
 *
 * Any string value may reference ${ENV_VAR}; unset variables expand to "".
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AuditServiceConfig config;

        static LoadResult ok(AuditServiceConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to gabi-audit.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML content
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Load config from SPLUNK_ENDPOINT, SPLUNK_TOKEN, SPLUNK_INDEX,
     *        HOST, NAMESPACE and POD_NAME. HTTP and logging keep their defaults.
     */
    [[nodiscard]] static LoadResult load_from_env();

    /// All validation failures, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const AuditServiceConfig& config);

private:
    static LoadResult validate_and_return(AuditServiceConfig config);
};

} // namespace gabi
