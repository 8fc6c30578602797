#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "../../utils/text/string_utils.hpp"

namespace Ferret {
namespace Network {
namespace Http {

enum class ErrorType { None, Timeout, Connection, Ssl, Proxy, Http, InvalidUrl };

enum class HTTPCode { Forbidden = 403, TooManyRequests = 429 };

using Headers = std::vector<std::pair<std::string, std::string>>;

inline const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None:
            return "none";
        case ErrorType::Timeout:
            return "timeout";
        case ErrorType::Connection:
            return "connection";
        case ErrorType::Ssl:
            return "ssl";
        case ErrorType::Proxy:
            return "proxy";
        case ErrorType::Http:
            return "http";
        case ErrorType::InvalidUrl:
            return "invalid_url";
    }
    return "unknown";
}

// Failures below the HTTP layer. These are always eligible for retry.
inline bool is_transport_error(ErrorType type) {
    return type == ErrorType::Timeout || type == ErrorType::Connection || type == ErrorType::Ssl
           || type == ErrorType::Proxy;
}

}  // namespace Http
}  // namespace Network
}  // namespace Ferret

namespace Ferret {

struct Request {
    std::string                        url;
    std::string                        proxy;
    Network::Http::Headers             headers;
    std::map<std::string, std::string> cookies;
    std::chrono::milliseconds          timeout{30000};
    bool                               follow_redirects = true;
    bool                               verify_ssl       = true;
};

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    Network::Http::Headers   headers;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;

    std::vector<std::string> header_values(const std::string& name) const {
        std::vector<std::string> values;
        std::string              wanted = Utils::Text::to_lower(name);
        for (const auto& [key, value] : headers) {
            if (Utils::Text::to_lower(key) == wanted)
                values.push_back(value);
        }
        return values;
    }

    std::string header(const std::string& name) const {
        auto values = header_values(name);
        return values.empty() ? "" : values.front();
    }
};

namespace Network {
namespace Http {

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual boost::asio::awaitable<Response> get(const Request& request) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Ferret
