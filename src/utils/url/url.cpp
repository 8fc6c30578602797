#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <tuple>
#include <vector>
#include "../text/string_utils.hpp"

namespace Ferret {
namespace Utils {

using namespace Ferret::Utils::Text;

namespace {

struct QueryParam {
    std::string key;
    std::string value;
    std::string raw;
};

std::string sort_query(const std::string& query) {
    std::vector<QueryParam> params;
    std::stringstream       ss(query);
    std::string             segment;
    while (std::getline(ss, segment, '&')) {
        segment = trim(segment);
        if (segment.empty())
            continue;
        size_t eq = segment.find('=');
        if (eq == std::string::npos)
            params.push_back({segment, "", segment});
        else
            params.push_back({segment.substr(0, eq), segment.substr(eq + 1), segment});
    }

    std::stable_sort(params.begin(), params.end(), [](const QueryParam& a, const QueryParam& b) {
        return std::tie(a.key, a.value) < std::tie(b.key, b.value);
    });

    std::string out;
    for (const auto& p : params) {
        if (!out.empty())
            out += "&";
        out += p.raw;
    }
    return out;
}

bool is_trimmed_char(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool is_valid_port(const std::string& port) {
    if (port.empty() || port.size() > 5)
        return false;
    if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); }))
        return false;
    int value = std::stoi(port);
    return value > 0 && value <= 65535;
}

bool is_default_port(const std::string& scheme, const std::string& port) {
    return (scheme == "http" && port == "80") || (scheme == "https" && port == "443");
}

// Leading "scheme:" per RFC 3986, anything before the first '/', '?' or '#'.
std::string scheme_of(const std::string& ref) {
    size_t colon = ref.find(':');
    if (colon == std::string::npos || colon == 0)
        return "";
    size_t delim = ref.find_first_of("/?#");
    if (delim != std::string::npos && delim < colon)
        return "";
    if (!std::isalpha(static_cast<unsigned char>(ref[0])))
        return "";
    for (size_t i = 1; i < colon; ++i) {
        unsigned char c = ref[i];
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return "";
    }
    return to_lower(ref.substr(0, colon));
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        sv = (end_auth != std::string_view::npos) ? sv.substr(end_auth) : std::string_view();

        size_t      at        = authority.find_last_of('@');
        std::string host_port = authority;
        if (at != std::string::npos) {
            parsed.userinfo = authority.substr(0, at);
            host_port       = authority.substr(at + 1);
        }

        if (!host_port.empty() && host_port[0] == '[') {
            size_t end_bracket = host_port.find(']');
            if (end_bracket != std::string::npos) {
                parsed.host    = host_port.substr(0, end_bracket + 1);
                size_t p_colon = host_port.find(':', end_bracket + 1);
                if (p_colon != std::string::npos)
                    parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
        else {
            size_t p_colon = host_port.find_last_of(':');
            if (p_colon != std::string::npos) {
                parsed.host = host_port.substr(0, p_colon);
                parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative[0] == '#') {
        size_t frag = base.find('#');
        if (frag == std::string::npos)
            return base + relative;
        return base.substr(0, frag) + relative;
    }

    if (relative[0] == '?') {
        size_t cut = base.find_first_of("?#");
        return (cut == std::string::npos ? base : base.substr(0, cut)) + relative;
    }

    std::string scheme = scheme_of(relative);
    if (!scheme.empty()) {
        if (scheme == "http" || scheme == "https")
            return relative;
        return "";
    }

    UrlParsed   base_parsed = parse(base);
    std::string auth        = base_parsed.host;
    if (!base_parsed.port.empty())
        auth += ":" + base_parsed.port;
    std::string result;

    if (relative.substr(0, 2) == "//") {
        return base_parsed.scheme + ":" + relative;
    }

    if (relative[0] == '/') {
        result = base_parsed.scheme + "://" + auth + relative;
    }
    else {
        std::string dir        = base_parsed.path;
        size_t      last_slash = dir.find_last_of('/');
        dir = (last_slash != std::string::npos) ? dir.substr(0, last_slash + 1) : "/";
        result = base_parsed.scheme + "://" + auth + dir + relative;
    }

    size_t scheme_end = result.find("://");
    size_t domain_end = (scheme_end == std::string::npos) ? 0 : result.find('/', scheme_end + 3);
    if (domain_end == std::string::npos)
        domain_end = result.length();

    std::string path = result.substr(domain_end);
    std::string query_frag;
    size_t      qf = path.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = path.substr(qf);
        path       = path.substr(0, qf);
    }

    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized_path = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized_path += segments[i];
        if (i < segments.size() - 1)
            normalized_path += "/";
    }
    if (path.length() > 1 && path.back() == '/' && normalized_path.back() != '/') {
        normalized_path += "/";
    }

    return result.substr(0, domain_end) + normalized_path + query_frag;
}

std::string Url::normalize(const std::string& url) {
    std::string input = trim(url);
    if (input.empty())
        throw InvalidUrl("Empty URL");
    size_t scheme_sep = input.find("://");
    if (scheme_sep == std::string::npos)
        throw InvalidUrl("Not an absolute URL: " + url);

    // The fragment goes first so whitespace in front of '#' is trimmed too.
    size_t hash = input.find('#', scheme_sep + 3);
    if (hash != std::string::npos)
        input = trim(input.substr(0, hash));

    UrlParsed   parsed = parse(input);
    std::string scheme = to_lower(parsed.scheme);
    if (scheme != "http" && scheme != "https")
        throw InvalidUrl("Unsupported scheme: " + url);

    std::string host = to_lower(parsed.host);
    if (host.empty())
        throw InvalidUrl("Missing host: " + url);
    if (std::any_of(host.begin(), host.end(), [](unsigned char c) {
            return std::isspace(c) || std::iscntrl(c);
        }))
        throw InvalidUrl("Malformed host: " + url);
    if (host[0] != '[' && host.find(':') != std::string::npos)
        throw InvalidUrl("Malformed host: " + url);

    std::string port = parsed.port;
    if (!port.empty()) {
        if (!is_valid_port(port))
            throw InvalidUrl("Invalid port: " + url);
        port = std::to_string(std::stoi(port));
        if (is_default_port(scheme, port))
            port.clear();
    }

    std::string path = parsed.path;
    while (path.size() > 1 && (path.back() == '/' || is_trimmed_char(path.back())))
        path.pop_back();

    std::string out = scheme + "://";
    if (!parsed.userinfo.empty())
        out += parsed.userinfo + "@";
    out += host;
    if (!port.empty())
        out += ":" + port;
    out += path;

    std::string query = sort_query(parsed.query);
    if (!query.empty())
        out += "?" + query;
    return out;
}

std::string Url::domain(const std::string& url) {
    std::string host = to_lower(parse(url).host);
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    return host;
}

std::string Url::origin(const std::string& url) {
    UrlParsed   parsed = parse(url);
    std::string scheme = to_lower(parsed.scheme);
    std::string out    = scheme + "://" + to_lower(parsed.host);
    if (!parsed.port.empty() && !is_default_port(scheme, parsed.port))
        out += ":" + parsed.port;
    return out;
}

bool Url::is_same_domain(const std::string& url1, const std::string& url2) {
    return domain(url1) == domain(url2);
}

bool Url::is_http(const std::string& url) {
    std::string scheme = to_lower(parse(url).scheme);
    return scheme == "http" || scheme == "https";
}

}  // namespace Utils
}  // namespace Ferret
