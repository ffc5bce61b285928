#include "audit/splunk_audit.hpp"
#include "audit/splunk_event.hpp"
#include "audit/splunk_response.hpp"
#include "core/url.hpp"
#include "core/version.hpp"
#include "http/http_constants.hpp"

#include <utility>

namespace gabi {

namespace {

constexpr const char* kEncodeEventHeadline = "unable to encode Splunk event";
constexpr const char* kCreateRequestHeadline = "unable to create request to Splunk";
constexpr const char* kSendRequestHeadline = "unable to send request to Splunk";

} // anonymous namespace

// ============================================================================
// Options
// ============================================================================

SplunkAudit::Option with_index(std::string index) {
    return [index = std::move(index)](SplunkAudit& audit) {
        audit.env().index = index;
    };
}

SplunkAudit::Option with_http_client(std::shared_ptr<IHttpClient> client) {
    return [client = std::move(client)](SplunkAudit& audit) {
        audit.set_http_client(client);
    };
}

// ============================================================================
// Construction
// ============================================================================

SplunkAudit::SplunkAudit(SplunkEnv env, std::vector<Option> options)
    : env_(std::move(env)),
      client_(HttpClient::make_default()) {
    for (const auto& option : options) {
        if (option) option(*this);
    }
}

void SplunkAudit::set_http_client(std::shared_ptr<IHttpClient> client) {
    client_ = client ? std::move(client) : HttpClient::make_default();
}

std::string SplunkAudit::name() const {
    return "splunk:" + env_.endpoint;
}

// ============================================================================
// Request construction
// ============================================================================

Result<HttpRequest> SplunkAudit::build_request(std::string payload) const {
    auto url = parse_url(env_.endpoint);
    if (url.is_error()) {
        return Result<HttpRequest>::error(ErrorCategory::CREATE_REQUEST_ERROR, url.error_message());
    }

    HttpRequest request;
    request.method = "POST";
    request.url = std::move(url.value());
    request.body = std::move(payload);

    std::string authorization(http::kSplunkAuthPrefix);
    authorization += env_.token;

    request.headers = {
        {http::kAcceptHeader, http::kJsonContentType},
        {http::kAcceptEncodingHeader, http::kGzipEncoding},
        {http::kAuthorizationHeader, std::move(authorization)},
        {http::kContentTypeHeader, http::kJsonUtf8ContentType},
        {http::kUserAgentHeader, user_agent()},
    };
    return Result<HttpRequest>::ok(std::move(request));
}

// ============================================================================
// Write
// ============================================================================

Status SplunkAudit::write(const QueryData& data) {
    auto payload = serialize_splunk_event(build_splunk_event(data, env_));
    if (payload.is_error()) {
        return Status::error(ErrorCategory::INTERNAL_ERROR, kEncodeEventHeadline,
                             payload.error_message());
    }

    auto request = build_request(std::move(payload.value()));
    if (request.is_error()) {
        return Status::error(ErrorCategory::CREATE_REQUEST_ERROR, kCreateRequestHeadline,
                             request.error_message());
    }

    const auto response = client_->send(request.value());
    if (response.is_error()) {
        return Status::error(ErrorCategory::SEND_REQUEST_ERROR, kSendRequestHeadline,
                             response.error_message());
    }

    // HTTP status is not consulted: the ack body alone decides the outcome
    return interpret_splunk_response(response.value().body);
}

} // namespace gabi
