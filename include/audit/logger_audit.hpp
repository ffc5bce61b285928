#pragma once

#include "audit/audit_sink.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace gabi {

/**
 * @brief Audit sink that records queries in the service log
 *
 * Writes one INFO line per record through utils::log. Never fails.
 */
class LoggerAudit : public IQueryAudit {
public:
    struct Config {
        std::string ident = "gabi";
    };

    LoggerAudit() = default;
    explicit LoggerAudit(Config config);

    [[nodiscard]] Status write(const QueryData& data) override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] uint64_t records_written() const {
        return records_written_.load(std::memory_order_relaxed);
    }

    /// Log line for a record (exposed for testing)
    [[nodiscard]] static std::string format_record(const QueryData& data);

private:
    Config config_;
    std::atomic<uint64_t> records_written_{0};
};

} // namespace gabi
