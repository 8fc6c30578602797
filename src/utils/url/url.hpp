#pragma once
#include <stdexcept>
#include <string>

namespace Ferret {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    std::string start_url;
};

class InvalidUrl : public std::invalid_argument {
public:
    explicit InvalidUrl(const std::string& what) : std::invalid_argument(what) {
    }
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);

    /**
     * Canonical form used for dedup and cache keys. Throws InvalidUrl for
     * anything that is not an absolute http(s) URL with a host.
     */
    static std::string normalize(const std::string& url);

    // Lowercased host without port.
    static std::string domain(const std::string& url);
    // scheme://host[:port]
    static std::string origin(const std::string& url);

    static bool is_same_domain(const std::string& url1, const std::string& url2);
    static bool is_http(const std::string& url);
};

}  // namespace Utils
}  // namespace Ferret
