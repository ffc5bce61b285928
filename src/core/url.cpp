#include "core/url.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace gabi {

namespace {

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

/// Returns the offending escape sequence, or nullopt if all escapes are well-formed
std::optional<std::string_view> find_bad_escape(std::string_view s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') continue;
        if (i + 2 >= s.size() || !is_hex(s[i + 1]) || !is_hex(s[i + 2])) {
            return s.substr(i, std::min<size_t>(3, s.size() - i));
        }
        i += 2;
    }
    return std::nullopt;
}

bool is_scheme_char(char c, bool first) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) return true;
    if (first) return false;
    return std::isdigit(uc) || c == '+' || c == '-' || c == '.';
}

// Characters that may not appear in a host name
bool is_invalid_host_char(char c) {
    switch (c) {
        case ' ': case '<': case '>': case '"': case '{': case '}':
        case '|': case '\\': case '^': case '`':
            return true;
        default:
            return false;
    }
}

Result<Url> parse_error(std::string message) {
    return Result<Url>::error(ErrorCategory::CREATE_REQUEST_ERROR, std::move(message));
}

} // anonymous namespace

uint16_t Url::effective_port() const {
    if (port) return *port;
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    return 0;
}

std::string Url::origin() const {
    if (is_ipv6_literal()) {
        return std::format("{}://[{}]:{}", scheme, host, effective_port());
    }
    return std::format("{}://{}:{}", scheme, host, effective_port());
}

std::string Url::request_target() const {
    std::string target = path.empty() ? "/" : path;
    if (!query.empty()) {
        target += '?';
        target += query;
    }
    return target;
}

Result<Url> parse_url(std::string_view raw) {
    for (const char c : raw) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) {
            return parse_error(std::format("parse \"{}\": invalid control character in URL", raw));
        }
    }

    Url url;
    url.raw = std::string(raw);
    std::string_view rest = raw;

    if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }
    if (const auto q = rest.find('?'); q != std::string_view::npos) {
        url.query = std::string(rest.substr(q + 1));
        rest = rest.substr(0, q);
    }

    if (const auto bad = find_bad_escape(rest)) {
        return parse_error(std::format("parse \"{}\": invalid URL escape \"{}\"", raw, *bad));
    }

    // Scheme: letters first, then letters/digits/+-. up to ':'
    for (size_t i = 0; i < rest.size(); ++i) {
        const char c = rest[i];
        if (c == ':') {
            if (i == 0) {
                return parse_error(std::format("parse \"{}\": missing protocol scheme", raw));
            }
            url.scheme = utils::to_lower(rest.substr(0, i));
            rest = rest.substr(i + 1);
            break;
        }
        if (!is_scheme_char(c, i == 0)) break;
    }

    // Without a scheme, "host:port/path" would read as a relative path
    if (url.scheme.empty() && !rest.starts_with('/')) {
        const auto segment = rest.substr(0, rest.find('/'));
        if (segment.find(':') != std::string_view::npos) {
            return parse_error(std::format(
                "parse \"{}\": first path segment in URL cannot contain colon", raw));
        }
    }

    if (rest.starts_with("//")) {
        rest = rest.substr(2);
        const auto slash = rest.find('/');
        std::string_view authority = rest.substr(0, slash);
        rest = (slash == std::string_view::npos) ? std::string_view{} : rest.substr(slash);

        if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority = authority.substr(at + 1);
        }

        std::string_view port_str;
        bool has_port = false;
        if (authority.starts_with('[')) {
            const auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return parse_error(std::format("parse \"{}\": missing ']' in host", raw));
            }
            url.host = std::string(authority.substr(1, close - 1));
            const auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return parse_error(std::format("parse \"{}\": invalid port \"{}\" after host", raw, after));
                }
                port_str = after.substr(1);
                has_port = true;
            }
        } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
            url.host = std::string(authority.substr(0, colon));
            port_str = authority.substr(colon + 1);
            has_port = true;
        } else {
            url.host = std::string(authority);
        }

        if (const auto it = std::find_if(url.host.begin(), url.host.end(), is_invalid_host_char);
            it != url.host.end()) {
            return parse_error(std::format("parse \"{}\": invalid character \"{}\" in host name", raw, *it));
        }

        if (has_port && !port_str.empty()) {
            const auto port = utils::try_parse_int<uint16_t>(port_str);
            if (!port) {
                return parse_error(std::format("parse \"{}\": invalid port \":{}\" after host", raw, port_str));
            }
            url.port = *port;
        }
    }

    url.path = std::string(rest);
    return Result<Url>::ok(std::move(url));
}

} // namespace gabi
