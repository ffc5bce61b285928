#pragma once

#include "audit/query_data.hpp"
#include "core/error.hpp"

#include <string>

namespace gabi {

/**
 * @brief Abstract interface for audit destinations
 *
 * Each call to write() delivers one record synchronously and reports the
 * outcome to the caller. Nothing is buffered or retried.
 */
class IQueryAudit {
public:
    virtual ~IQueryAudit() = default;

    /// Deliver a single query record.
    [[nodiscard]] virtual Status write(const QueryData& data) = 0;

    /// Human-readable sink name for logging (e.g. "splunk:https://hec.example.com")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace gabi
