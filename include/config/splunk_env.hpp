#pragma once

#include <string>

namespace gabi {

/**
 * @brief Splunk HTTP Event Collector settings
 *
 * Supplied by ConfigLoader. Every field may be empty; SplunkAudit reports
 * the resulting failures at write time instead of rejecting them up front.
 */
struct SplunkEnv {
    std::string endpoint;        // Full HEC URL, e.g. https://hec:8088/services/collector/event
    std::string token;           // HEC token, sent as "Authorization: Splunk <token>"
    std::string index;           // Target index (omitted from events when empty)
    std::string host;            // Deployment identifiers attached to every event
    std::string namespace_name;
    std::string pod;

    bool operator==(const SplunkEnv&) const = default;
};

} // namespace gabi
