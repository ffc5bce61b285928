#include "audit/splunk_response.hpp"
#include "core/utils.hpp"

#include <glaze/glaze.hpp>

#include <cmath>
#include <format>
#include <limits>

namespace gabi {

namespace {

constexpr const char* kUnmarshalHeadline = "unable to unmarshal Splunk response";
constexpr const char* kRejectedHeadline = "unable to write to Splunk";

Result<SplunkResponse> decode_error(std::string message) {
    return Result<SplunkResponse>::error(ErrorCategory::RESPONSE_DECODE_ERROR, std::move(message));
}

const char* json_type_name(const glz::json_t& value) {
    if (value.is_null()) return "null";
    if (value.is_boolean()) return "bool";
    if (value.is_number()) return "number";
    if (value.is_string()) return "string";
    if (value.is_array()) return "array";
    return "object";
}

} // anonymous namespace

Result<SplunkResponse> decode_splunk_response(const std::string& body) {
    glz::json_t doc;
    if (const auto ec = glz::read_json(doc, body)) {
        return decode_error(glz::format_error(ec, body));
    }

    SplunkResponse response;
    if (doc.is_null()) {
        return Result<SplunkResponse>::ok(std::move(response));
    }
    if (!doc.is_object()) {
        return decode_error(std::format("cannot unmarshal {} into Splunk response", json_type_name(doc)));
    }

    for (const auto& [key, value] : doc.get_object()) {
        if (utils::iequals(key, "code")) {
            if (value.is_null()) continue;
            if (!value.is_number()) {
                return decode_error(std::format("cannot unmarshal {} into field Code of type int",
                                                json_type_name(value)));
            }
            const double d = value.get<double>();
            if (d != std::floor(d) || !std::isfinite(d) ||
                d < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
                d >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
                return decode_error(std::format("cannot unmarshal number {} into field Code of type int", d));
            }
            response.code = static_cast<int64_t>(d);
        } else if (utils::iequals(key, "text")) {
            if (value.is_null()) continue;
            if (!value.is_string()) {
                return decode_error(std::format("cannot unmarshal {} into field Text of type string",
                                                json_type_name(value)));
            }
            response.text = value.get<std::string>();
        }
    }

    return Result<SplunkResponse>::ok(std::move(response));
}

Status interpret_splunk_response(const std::string& body) {
    const auto decoded = decode_splunk_response(body);
    if (decoded.is_error()) {
        return Status::error(ErrorCategory::RESPONSE_DECODE_ERROR, kUnmarshalHeadline,
                             decoded.error_message());
    }

    const auto& ack = decoded.value();
    if (ack.code != 0) {
        return Status::error(ErrorCategory::COLLECTOR_REJECTED_ERROR, kRejectedHeadline,
                             std::format("{} (code {})", ack.text, ack.code));
    }
    return Status::ok();
}

} // namespace gabi
