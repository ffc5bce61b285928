#include "http/http_client.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only: suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <exception>
#include <format>

namespace gabi {

namespace {

Result<HttpResponse> send_error(std::string message) {
    return Result<HttpResponse>::error(ErrorCategory::SEND_REQUEST_ERROR, std::move(message));
}

} // anonymous namespace

const std::string* HttpRequest::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (utils::iequals(key, name)) return &value;
    }
    return nullptr;
}

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(TransportConfig transport)
    : transport_(std::move(transport)) {}

std::shared_ptr<HttpClient> HttpClient::make_default() {
    return std::make_shared<HttpClient>(TransportConfig{});
}

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    const Url& url = request.url;
    const auto target = std::format("{} \"{}\"", request.method, url.raw);

    if (url.scheme != "http" && url.scheme != "https") {
        return send_error(std::format("{}: unsupported protocol scheme \"{}\"", target, url.scheme));
    }
    if (url.host.empty()) {
        return send_error(std::format("{}: no Host in request URL", target));
    }

    try {
        httplib::Client client(url.origin());
        if (!client.is_valid()) {
            return send_error(std::format("{}: unable to initialize client for {}", target, url.origin()));
        }

        if (transport_) {
            client.set_connection_timeout(transport_->connection_timeout);
            client.set_read_timeout(transport_->read_timeout);
            client.set_write_timeout(transport_->write_timeout);
            client.enable_server_certificate_verification(transport_->verify_tls);
            if (!transport_->ca_cert_file.empty()) {
                client.set_ca_cert_path(transport_->ca_cert_file);
            }
        }
        client.set_decompress(true);
        // Keeps httplib from adding "Connection: close"; the socket closes with the client
        client.set_keep_alive(true);

        httplib::Request req;
        req.method = request.method;
        req.path = url.request_target();
        req.body = request.body;
        for (const auto& [name, value] : request.headers) {
            req.headers.emplace(name, value);
        }

        auto res = client.send(req);
        if (!res) {
            return send_error(std::format("{}: {}", target, httplib::to_string(res.error())));
        }

        HttpResponse response;
        response.status = res->status;
        response.body = std::move(res->body);
        return Result<HttpResponse>::ok(std::move(response));
    } catch (const std::exception& e) {
        return send_error(std::format("{}: {}", target, e.what()));
    }
}

} // namespace gabi
