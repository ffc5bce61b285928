#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <string>

namespace gabi {

/// HEC acknowledgment body: {"Code": int, "Text": string}
struct SplunkResponse {
    int64_t code = 0;    // 0 = accepted
    std::string text;
};

/**
 * @brief Decode an acknowledgment body.
 *
 * Keys are matched case-insensitively (HEC itself answers with lowercase
 * "code"/"text"); unknown keys are ignored and missing ones keep their
 * defaults. A JSON null decodes to an accepted ack.
 * Fails with RESPONSE_DECODE_ERROR on malformed JSON, a non-object document,
 * a non-integral code or a non-string text.
 */
[[nodiscard]] Result<SplunkResponse> decode_splunk_response(const std::string& body);

/**
 * @brief Turn an acknowledgment body into the outcome of a write.
 * @return ok for code 0, RESPONSE_DECODE_ERROR or COLLECTOR_REJECTED_ERROR otherwise
 */
[[nodiscard]] Status interpret_splunk_response(const std::string& body);

} // namespace gabi
