#pragma once

#include "core/error.hpp"
#include "core/url.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gabi {

struct HttpRequest {
    std::string method = "POST";
    Url url;
    std::vector<std::pair<std::string, std::string>> headers;  // sent in order
    std::string body;

    [[nodiscard]] const std::string* header(std::string_view name) const;
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

/**
 * @brief Connection behavior for HttpClient
 *
 * Absent on a bare HttpClient, in which case the HTTP library defaults apply.
 */
struct TransportConfig {
    std::chrono::milliseconds connection_timeout{10000};
    std::chrono::milliseconds read_timeout{30000};
    std::chrono::milliseconds write_timeout{30000};
    bool verify_tls = true;
    std::string ca_cert_file;   // empty = system trust store
};

/**
 * @brief Abstract HTTP client used by audit sinks
 *
 * send() performs one complete exchange. A response with any status code is
 * a successful exchange; only failures to connect, write or read are errors
 * (SEND_REQUEST_ERROR). Implementations must be safe for concurrent send().
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    [[nodiscard]] virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief cpp-httplib backed client
 *
 * Opens one connection per request, so concurrent sends share nothing.
 * Gzip-encoded responses are decompressed before being returned.
 */
class HttpClient : public IHttpClient {
public:
    HttpClient() = default;
    explicit HttpClient(TransportConfig transport);

    /// Client with the default TransportConfig installed
    [[nodiscard]] static std::shared_ptr<HttpClient> make_default();

    [[nodiscard]] Result<HttpResponse> send(const HttpRequest& request) override;

    [[nodiscard]] const std::optional<TransportConfig>& transport() const { return transport_; }

private:
    std::optional<TransportConfig> transport_;
};

} // namespace gabi
