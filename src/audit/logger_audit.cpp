#include "audit/logger_audit.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace gabi {

LoggerAudit::LoggerAudit(Config config)
    : config_(std::move(config)) {}

std::string LoggerAudit::format_record(const QueryData& data) {
    return std::format("AUDIT user=\"{}\" timestamp={} query=\"{}\"",
                       utils::escape_json(data.user), data.timestamp,
                       utils::escape_json(data.query));
}

Status LoggerAudit::write(const QueryData& data) {
    utils::log::info(std::format("[{}] {}", config_.ident, format_record(data)));
    records_written_.fetch_add(1, std::memory_order_relaxed);
    return Status::ok();
}

std::string LoggerAudit::name() const {
    return "logger:" + config_.ident;
}

} // namespace gabi
