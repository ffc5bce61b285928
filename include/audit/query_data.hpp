#pragma once

#include <cstdint>
#include <string>

namespace gabi {

// ============================================================================
// Query Data
// ============================================================================

/// One executed query as handed to the audit trail
struct QueryData {
    std::string query;        // Statement text, may be empty
    std::string user;         // Invoking identity, may be empty
    int64_t timestamp = 0;    // Unix epoch seconds
};

} // namespace gabi
