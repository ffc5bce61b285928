#include "audit/splunk_event.hpp"

#include <glaze/glaze.hpp>

#include <utility>

template <>
struct glz::meta<gabi::SplunkEventData> {
    using T = gabi::SplunkEventData;
    static constexpr auto value = object(
        "query", &T::query,
        "user", &T::user,
        "namespace", &T::namespace_name,
        "pod", &T::pod);
};

template <>
struct glz::meta<gabi::SplunkEvent> {
    using T = gabi::SplunkEvent;
    static constexpr auto value = object(
        "event", &T::event,
        "sourcetype", &T::sourcetype,
        "index", &T::index,
        "host", &T::host,
        "time", &T::time);
};

namespace gabi {

SplunkEvent build_splunk_event(const QueryData& data, const SplunkEnv& env) {
    SplunkEvent event;
    event.event.query = data.query;
    event.event.user = data.user;
    event.event.namespace_name = env.namespace_name;
    event.event.pod = env.pod;
    event.sourcetype = std::string(kSplunkSourceType);
    if (!env.index.empty()) {
        event.index = env.index;
    }
    event.host = env.host;
    event.time = data.timestamp;
    return event;
}

Result<std::string> serialize_splunk_event(const SplunkEvent& event) {
    std::string buffer;
    if (const auto ec = glz::write_json(event, buffer)) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
                                          glz::format_error(ec, buffer));
    }
    return Result<std::string>::ok(std::move(buffer));
}

} // namespace gabi
