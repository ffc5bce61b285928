#pragma once

#include "audit/query_data.hpp"
#include "config/splunk_env.hpp"
#include "core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gabi {

inline constexpr std::string_view kSplunkSourceType = "json";

// ============================================================================
// HEC Event Envelope
// ============================================================================

struct SplunkEventData {
    std::string query;
    std::string user;
    std::string namespace_name;
    std::string pod;
};

/**
 * @brief One HEC event as POSTed to the collector
 *
 * Serialized key order is fixed: event{query, user, namespace, pod},
 * sourcetype, [index], host, time. The collector extracts indexed fields
 * positionally, so the order must not change.
 */
struct SplunkEvent {
    SplunkEventData event;
    std::string sourcetype;
    std::optional<std::string> index;   // omitted when not configured
    std::string host;
    int64_t time = 0;
};

/// Map a query record and deployment identifiers onto the envelope. Pure.
[[nodiscard]] SplunkEvent build_splunk_event(const QueryData& data, const SplunkEnv& env);

/// Compact JSON encoding of the envelope. Fails only if the encoder does.
[[nodiscard]] Result<std::string> serialize_splunk_event(const SplunkEvent& event);

} // namespace gabi
