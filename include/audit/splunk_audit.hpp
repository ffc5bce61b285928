#pragma once

#include "audit/audit_sink.hpp"
#include "config/splunk_env.hpp"
#include "http/http_client.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gabi {

/**
 * @brief Audit sink for a Splunk HTTP Event Collector
 *
 * Each write() builds one HEC event, POSTs it with the token as
 * "Authorization: Splunk <token>" and checks the collector's ack.
 * One blocking round trip per call: no buffering, batching or retries.
 *
 * write() may be called from several threads at once. The setters and the
 * mutable env() accessor are for use before the first write only.
 */
class SplunkAudit : public IQueryAudit {
public:
    /// Configuration mutator applied once, in order, at construction
    using Option = std::function<void(SplunkAudit&)>;

    explicit SplunkAudit(SplunkEnv env, std::vector<Option> options = {});

    [[nodiscard]] Status write(const QueryData& data) override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] SplunkEnv& env() { return env_; }
    [[nodiscard]] const SplunkEnv& env() const { return env_; }

    [[nodiscard]] const std::shared_ptr<IHttpClient>& http_client() const { return client_; }
    void set_http_client(std::shared_ptr<IHttpClient> client);

    /// POST request for an encoded event. Fails with CREATE_REQUEST_ERROR
    /// when the endpoint cannot be parsed.
    [[nodiscard]] Result<HttpRequest> build_request(std::string payload) const;

private:
    SplunkEnv env_;
    std::shared_ptr<IHttpClient> client_;
};

[[nodiscard]] SplunkAudit::Option with_index(std::string index);
[[nodiscard]] SplunkAudit::Option with_http_client(std::shared_ptr<IHttpClient> client);

} // namespace gabi
